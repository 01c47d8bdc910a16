// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef ENVIRONMENT_MODULE_HPP
#define ENVIRONMENT_MODULE_HPP

#include "core/NoticeBus.hpp"
#include "core/FileSystem.hpp"
#include "core/ProcessEnvironment.hpp"
#include "core/RunContext.hpp"
#include "core/StepResult.hpp"
#include "modules/VenvProvisioner.hpp"
#include <optional>
#include <string>

namespace Preflight::Modules {

    /**
     * @brief Izolált környezet keresése, létrehozása és aktiválása.
     *
     * Feloldási sorrend (az első találat nyer):
     *   1. meglévő "venv" könyvtár
     *   2. meglévő ".venv" könyvtár
     *   3. új ".venv" létrehozása
     * CI módban az egész lépés kimarad, a futó gép Pythonját használjuk.
     */
    class EnvironmentModule {
    public:
        EnvironmentModule(Core::NoticeBus& busRef,
                          Core::FileSystem& fsRef,
                          Core::ProcessEnvironment& envRef,
                          EnvironmentProvisioner& provisionerRef);

        Core::StepResult acquire(const Core::RunContext& ctx);

        // Az aktív környezet, ha van. CI módban mindig üres.
        const std::optional<Core::IsolatedEnvironment>& active() const { return activeEnv; }

    private:
        Core::NoticeBus& bus;
        Core::FileSystem& fs;
        Core::ProcessEnvironment& env;
        EnvironmentProvisioner& provisioner;
        std::optional<Core::IsolatedEnvironment> activeEnv;

        Core::StepResult create(const Core::RunContext& ctx);
        Core::StepResult activate(const Core::RunContext& ctx, const Core::IsolatedEnvironment& target);
    };

}

#endif
