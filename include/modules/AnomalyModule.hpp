// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef ANOMALY_MODULE_HPP
#define ANOMALY_MODULE_HPP

#include "core/NoticeBus.hpp"
#include "core/FileSystem.hpp"
#include "core/RunContext.hpp"
#include "core/StepResult.hpp"
#include <string>

namespace Preflight::Modules {

    /**
     * @brief A fenntartott .venv útvonal típus-ellenőrzése.
     * Ha ott egy nem-könyvtár bejegyzés áll (régi baleset), törli, hogy a
     * virtualenv könyvtár létrejöhessen. Utána az útvonal vagy hiányzik, vagy könyvtár.
     */
    class AnomalyModule {
    public:
        AnomalyModule(Core::NoticeBus& busRef, Core::FileSystem& fsRef);

        Core::StepResult normalize(const Core::RunContext& ctx);

    private:
        Core::NoticeBus& bus;
        Core::FileSystem& fs;
    };

}

#endif
