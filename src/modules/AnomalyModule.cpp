// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "modules/AnomalyModule.hpp"
#include "utils/ConfigTemplates.hpp"

namespace Preflight::Modules {

    namespace {
        const std::string SOURCE = "anomaly";
    }

    AnomalyModule::AnomalyModule(Core::NoticeBus& busRef, Core::FileSystem& fsRef)
        : bus(busRef), fs(fsRef) {}

    Core::StepResult AnomalyModule::normalize(const Core::RunContext& ctx) {
        const auto& name = PreflightTemplates::SECONDARY_ENV_DIR;
        const auto reserved = ctx.workingDirectory / name;

        std::error_code ec;
        bool present = fs.entryExists(reserved, ec);
        bool directory = present && !ec && fs.isDirectory(reserved, ec);
        if (ec) {
            // Ha nem tudjuk megvizsgálni, azt sem tudjuk, hogy a helyére létrejöhet-e a környezet
            return Core::StepResult::fatal(Core::FailureKind::AnomalyRemoval,
                "Cannot inspect " + reserved.string() + ": " + ec.message(),
                reserved.string());
        }

        // Hiányzik vagy könyvtár (symlink könyvtárra is az): nincs teendő
        if (!present || directory) {
            return Core::StepResult::success();
        }

        if (ctx.dryRun) {
            bus.pushEvent(SOURCE, "[DRY-RUN] Would remove stray file " + name);
            return Core::StepResult::success();
        }

        bus.pushEvent(SOURCE, "Removing stray file " + name + " so a virtualenv directory can be created");

        fs.removeEntry(reserved, ec);
        if (ec) {
            return Core::StepResult::fatal(Core::FailureKind::AnomalyRemoval,
                "Cannot remove stray file " + reserved.string() + ": " + ec.message(),
                reserved.string());
        }
        if (fs.entryExists(reserved, ec) || ec) {
            return Core::StepResult::fatal(Core::FailureKind::AnomalyRemoval,
                "Stray file still present after removal: " + reserved.string(),
                reserved.string());
        }
        return Core::StepResult::success();
    }

} // namespace Preflight::Modules
