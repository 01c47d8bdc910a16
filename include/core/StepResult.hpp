// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef STEP_RESULT_HPP
#define STEP_RESULT_HPP

#include <string>

namespace Preflight::Core {

    /**
     * @brief A hibák osztályozása. Minden nem-None érték végzetes: a futás leáll.
     */
    enum class FailureKind {
        None,
        Usage,          // Hibás parancssori opció
        AnomalyRemoval, // A .venv helyén álló fájl nem törölhető
        Provisioning,   // A virtualenv létrehozása nem sikerült
        Activation,     // A környezet nem aktiválható
        MissingInput,   // A megadott ZIP nem létezik
        Internal
    };

    /**
     * @brief Egy lépés eredménye. Kivétel helyett ezt adja vissza minden lépés.
     */
    struct StepResult {
        FailureKind failure = FailureKind::None;
        std::string message;
        std::string path; // Érintett útvonal, ha van

        [[nodiscard]] bool ok() const { return failure == FailureKind::None; }

        static StepResult success() { return StepResult{}; }
        static StepResult fatal(FailureKind kind, std::string message, std::string path = {});
    };

    /**
     * @brief A hibafajta leképezése a folyamat kilépési kódjára.
     */
    int exitCodeFor(FailureKind kind);

    const char* toString(FailureKind kind);
}

#endif
