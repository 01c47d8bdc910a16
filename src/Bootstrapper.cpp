// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "Bootstrapper.hpp"

namespace Preflight {

    namespace {
        const std::string SOURCE = "bootstrap";
    }

    const char* toString(BootstrapState state) {
        switch (state) {
            case BootstrapState::Start:               return "Start";
            case BootstrapState::AnomalyChecked:      return "AnomalyChecked";
            case BootstrapState::EnvironmentDetected: return "EnvironmentDetected";
            case BootstrapState::EnvironmentReady:    return "EnvironmentReady";
            case BootstrapState::EnvironmentSkipped:  return "EnvironmentSkipped";
            case BootstrapState::InputValidated:      return "InputValidated";
            case BootstrapState::Done:                return "Done";
            case BootstrapState::Failed:              return "Failed";
        }
        return "Unknown";
    }

    Bootstrapper::Bootstrapper(Core::NoticeBus& busRef,
                               Core::FileSystem& fsRef,
                               Core::ProcessEnvironment& envRef,
                               Modules::EnvironmentProvisioner& provisionerRef)
        : bus(busRef),
          anomaly(busRef, fsRef),
          environment(busRef, fsRef, envRef, provisionerRef),
          input(busRef, fsRef) {}

    void Bootstrapper::enter(BootstrapOutcome& outcome, BootstrapState next) {
        outcome.finalState = next;
        outcome.transitions.push_back(next);
    }

    BootstrapOutcome& Bootstrapper::fail(BootstrapOutcome& outcome, const Core::StepResult& result) {
        outcome.result = result;
        bus.pushEvent(SOURCE, std::string("Stopped after state ") + toString(outcome.finalState)
                              + " (" + Core::toString(result.failure) + ")");
        enter(outcome, BootstrapState::Failed);
        bus.pushError(SOURCE, result.message);
        return outcome;
    }

    BootstrapOutcome Bootstrapper::run(const Core::RunContext& ctx) {
        BootstrapOutcome outcome;
        outcome.transitions.push_back(BootstrapState::Start);

        // 1. Stray .venv fájl
        bus.pushStep(SOURCE, "Reserved path check");
        auto result = anomaly.normalize(ctx);
        if (!result.ok()) return fail(outcome, result);
        enter(outcome, BootstrapState::AnomalyChecked);

        // 2. CI vagy helyi futás (a jelző már a RunContext-ben van)
        bus.pushStep(SOURCE, ctx.isCI ? "Environment: CI runner" : "Environment: local workstation");
        enter(outcome, BootstrapState::EnvironmentDetected);

        // 3. Virtualenv
        bus.pushStep(SOURCE, "Isolated environment");
        result = environment.acquire(ctx);
        if (!result.ok()) return fail(outcome, result);
        outcome.environment = environment.active();
        enter(outcome, ctx.isCI ? BootstrapState::EnvironmentSkipped : BootstrapState::EnvironmentReady);

        // 4. Opcionális ZIP
        result = input.validate(ctx);
        if (!result.ok()) return fail(outcome, result);
        enter(outcome, BootstrapState::InputValidated);

        enter(outcome, BootstrapState::Done);
        return outcome;
    }
}
