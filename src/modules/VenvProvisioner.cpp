// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "modules/VenvProvisioner.hpp"
#include "core/SafeExecutor.hpp"
#include "utils/PreflightInitializer.hpp"
#include <utility>

namespace Preflight::Modules {

    VenvProvisioner::VenvProvisioner(const Core::FileSystem& fsRef, std::string interpreterName, std::string path)
        : fs(fsRef), interpreter(std::move(interpreterName)), searchPath(std::move(path)) {}

    Core::StepResult VenvProvisioner::provision(const std::filesystem::path& root) {
        auto binary = Init::resolveExecutable(interpreter, searchPath, fs);
        if (!binary) {
            return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                "Python interpreter not found: " + interpreter, root.string());
        }

        auto outcome = Core::SafeExecutor::run(binary->string(), {"-m", "venv", root.string()});
        if (!outcome.started) {
            return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                "Failed to launch " + binary->string(), root.string());
        }
        if (outcome.exitCode == 127) {
            return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                "Cannot execute " + binary->string(), root.string());
        }
        if (outcome.exitCode != 0) {
            return Core::StepResult::fatal(Core::FailureKind::Provisioning,
                binary->string() + " -m venv exited with status " + std::to_string(outcome.exitCode),
                root.string());
        }
        return Core::StepResult::success();
    }
}
