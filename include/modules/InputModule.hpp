#pragma once

#include <string>

#include "core/NoticeBus.hpp"
#include "core/FileSystem.hpp"
#include "core/RunContext.hpp"
#include "core/StepResult.hpp"

namespace Preflight::Modules {

// Az opcionális bemeneti archívum létezésének ellenőrzése.
// Formátumot, méretet, tartalmat nem vizsgál.
class InputModule final {
public:
    InputModule(Core::NoticeBus& busRef, const Core::FileSystem& fsRef);

    Core::StepResult validate(const Core::RunContext& ctx);

private:
    Core::NoticeBus& bus;
    const Core::FileSystem& fs;
};

}
