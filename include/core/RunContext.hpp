// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef RUN_CONTEXT_HPP
#define RUN_CONTEXT_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace Preflight::Core {

    /**
     * @brief A futás egyszer, induláskor kiszámolt tényei. A futás alatt nem változik.
     */
    struct RunContext {
        bool isCI = false;
        std::filesystem::path workingDirectory; // Mindig abszolút
        std::optional<std::filesystem::path> inputArchivePath;
        bool dryRun = false;
    };

    /**
     * @brief Egy lemezen lévő, izolált függőség-környezet (virtualenv).
     */
    struct IsolatedEnvironment {
        std::string name;              // "venv" vagy ".venv"
        std::filesystem::path root;
        std::filesystem::path binDir;
        bool created = false;          // Ebben a futásban jött létre?
    };
}

#endif
