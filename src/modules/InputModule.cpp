#include "modules/InputModule.hpp"

namespace Preflight::Modules {

namespace {
const std::string SOURCE = "input";
}

InputModule::InputModule(Core::NoticeBus& busRef, const Core::FileSystem& fsRef)
    : bus(busRef), fs(fsRef) {}

Core::StepResult InputModule::validate(const Core::RunContext& ctx) {
    bus.pushStep(SOURCE, "Sanity checks");

    if (!ctx.inputArchivePath) {
        bus.pushEvent(SOURCE, "No ZIP provided; skipping ZIP sanity check");
        return Core::StepResult::success();
    }

    const auto& given = *ctx.inputArchivePath;
    const auto resolved = given.is_absolute() ? given : ctx.workingDirectory / given;

    if (!fs.isRegularFile(resolved)) {
        return Core::StepResult::fatal(Core::FailureKind::MissingInput,
            "Zip not found: " + given.string(), given.string());
    }

    bus.pushEvent(SOURCE, "ZIP found: " + given.string());
    return Core::StepResult::success();
}

}
