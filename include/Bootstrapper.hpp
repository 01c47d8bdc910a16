// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework
// Bootstrapper: the linear pre-flight state machine

#ifndef BOOTSTRAPPER_HPP
#define BOOTSTRAPPER_HPP

#include <optional>
#include <vector>

#include "core/NoticeBus.hpp"
#include "core/FileSystem.hpp"
#include "core/ProcessEnvironment.hpp"
#include "core/RunContext.hpp"
#include "core/StepResult.hpp"
#include "modules/AnomalyModule.hpp"
#include "modules/EnvironmentModule.hpp"
#include "modules/InputModule.hpp"
#include "modules/VenvProvisioner.hpp"

namespace Preflight {

    enum class BootstrapState {
        Start,
        AnomalyChecked,
        EnvironmentDetected,
        EnvironmentReady,
        EnvironmentSkipped,
        InputValidated,
        Done,
        Failed
    };

    const char* toString(BootstrapState state);

    struct BootstrapOutcome {
        BootstrapState finalState = BootstrapState::Start;
        Core::StepResult result;
        std::vector<BootstrapState> transitions; // Start-tal kezdődik
        std::optional<Core::IsolatedEnvironment> environment;

        [[nodiscard]] bool ok() const { return finalState == BootstrapState::Done; }
        [[nodiscard]] int exitCode() const { return Core::exitCodeFor(result.failure); }
    };

    /**
     * @brief Start -> AnomalyChecked -> EnvironmentDetected -> EnvironmentReady|Skipped
     *        -> InputValidated -> Done. Az első végzetes hibánál Failed, a többi lépés kimarad.
     */
    class Bootstrapper {
    public:
        Bootstrapper(Core::NoticeBus& busRef,
                     Core::FileSystem& fsRef,
                     Core::ProcessEnvironment& envRef,
                     Modules::EnvironmentProvisioner& provisionerRef);

        BootstrapOutcome run(const Core::RunContext& ctx);

    private:
        Core::NoticeBus& bus;
        Modules::AnomalyModule anomaly;
        Modules::EnvironmentModule environment;
        Modules::InputModule input;

        void enter(BootstrapOutcome& outcome, BootstrapState next);
        BootstrapOutcome& fail(BootstrapOutcome& outcome, const Core::StepResult& result);
    };
}

#endif // BOOTSTRAPPER_HPP
