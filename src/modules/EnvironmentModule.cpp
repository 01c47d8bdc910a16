// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "modules/EnvironmentModule.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <vector>

namespace Preflight::Modules {

    namespace {
        const std::string SOURCE = "environment";

        Core::IsolatedEnvironment describeAt(const std::filesystem::path& workdir, const std::string& name, bool created) {
            Core::IsolatedEnvironment target;
            target.name = name;
            target.root = workdir / name;
            target.binDir = target.root / "bin";
            target.created = created;
            return target;
        }
    }

    EnvironmentModule::EnvironmentModule(Core::NoticeBus& busRef,
                                         Core::FileSystem& fsRef,
                                         Core::ProcessEnvironment& envRef,
                                         EnvironmentProvisioner& provisionerRef)
        : bus(busRef), fs(fsRef), env(envRef), provisioner(provisionerRef) {}

    Core::StepResult EnvironmentModule::acquire(const Core::RunContext& ctx) {
        activeEnv.reset();

        if (ctx.isCI) {
            bus.pushEvent(SOURCE, "CI detected; using runner Python (no venv)");
            return Core::StepResult::success();
        }

        bus.pushEvent(SOURCE, "Local run; preparing virtualenv");

        for (const auto& name : {PreflightTemplates::PRIMARY_ENV_DIR, PreflightTemplates::SECONDARY_ENV_DIR}) {
            auto candidate = describeAt(ctx.workingDirectory, name, false);
            std::error_code ec;
            bool found = fs.isDirectory(candidate.root, ec);
            if (ec) {
                return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                    "Cannot inspect " + candidate.root.string() + ": " + ec.message(),
                    candidate.root.string());
            }
            if (found) {
                bus.pushEvent(SOURCE, "Using existing virtualenv " + name);
                return activate(ctx, candidate);
            }
        }

        return create(ctx);
    }

    Core::StepResult EnvironmentModule::create(const Core::RunContext& ctx) {
        auto target = describeAt(ctx.workingDirectory, PreflightTemplates::SECONDARY_ENV_DIR, true);

        if (ctx.dryRun) {
            bus.pushEvent(SOURCE, "[DRY-RUN] Would create virtualenv " + target.name
                                  + " (" + provisioner.describe() + ")");
            bus.pushEvent(SOURCE, "[DRY-RUN] Would activate virtualenv " + target.name);
            activeEnv = target;
            return Core::StepResult::success();
        }

        bus.pushEvent(SOURCE, "Creating virtualenv " + target.name + " (" + provisioner.describe() + ")");

        auto result = provisioner.provision(target.root);
        if (!result.ok()) return result;

        // A provisioner sikert jelzett, de a könyvtárnak is meg kell lennie
        std::error_code ec;
        if (!fs.isDirectory(target.root, ec)) {
            return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                "Virtualenv was not created at " + target.root.string(), target.root.string());
        }

        return activate(ctx, target);
    }

    Core::StepResult EnvironmentModule::activate(const Core::RunContext& ctx, const Core::IsolatedEnvironment& target) {
        std::error_code ec;
        if (!fs.isDirectory(target.binDir, ec)) {
            return Core::StepResult::fatal(Core::FailureKind::Activation,
                "Virtualenv " + target.name + " has no bin directory: " + target.binDir.string()
                + (ec ? " (" + ec.message() + ")" : std::string()),
                target.binDir.string());
        }

        if (ctx.dryRun) {
            bus.pushEvent(SOURCE, "[DRY-RUN] Would activate virtualenv " + target.name);
            activeEnv = target;
            return Core::StepResult::success();
        }

        const std::string binDir = target.binDir.string();
        const std::string currentPath = env.get(PreflightTemplates::PATH_VAR).value_or("");
        std::vector<std::string> entries;
        if (!currentPath.empty()) entries = PreflightUtils::split(currentPath, ':');

        // Egy korábban aktivált környezet bin könyvtárát kivesszük (deactivate),
        // így ugyanannak a környezetnek az újraaktiválása sem duplikálja a PATH-t.
        auto previous = env.get(PreflightTemplates::VIRTUAL_ENV_VAR);
        if (previous && !previous->empty()) {
            const std::string previousBin = (std::filesystem::path(*previous) / "bin").string();
            entries.erase(std::remove(entries.begin(), entries.end(), previousBin), entries.end());
        }
        entries.insert(entries.begin(), binDir);

        bool applied = env.set(PreflightTemplates::VIRTUAL_ENV_VAR, target.root.string())
                    && env.set(PreflightTemplates::PATH_VAR, PreflightUtils::join(entries, ':'))
                    && env.unset(PreflightTemplates::PYTHONHOME_VAR);
        if (!applied) {
            return Core::StepResult::fatal(Core::FailureKind::Activation,
                "Cannot update process environment for virtualenv " + target.name,
                target.root.string());
        }

        bus.pushEvent(SOURCE, "Activated virtualenv " + target.name + " (" + target.root.string() + ")");
        activeEnv = target;
        return Core::StepResult::success();
    }

} // namespace Preflight::Modules
