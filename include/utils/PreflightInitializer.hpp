#ifndef PREFLIGHT_INITIALIZER_HPP
#define PREFLIGHT_INITIALIZER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/FileSystem.hpp"
#include "core/ProcessEnvironment.hpp"
#include "core/RunContext.hpp"
#include "core/StepResult.hpp"

namespace Preflight::Init {

    /**
     * @brief Az összefésült konfiguráció: alapértékek < környezeti változók < parancssor.
     */
    struct BootstrapConfig {
        bool showHelp = false;
        bool dryRun = false;
        bool isCI = false;
        std::filesystem::path workingDirectory;
        std::optional<std::filesystem::path> inputArchive;
        std::string interpreter;
        std::string searchPath;
        std::optional<std::filesystem::path> envFile;
    };

    /**
     * @brief CI futtató felismerése: csak a szó szerinti "true" érték számít.
     */
    bool detectEnvironment(const Core::ProcessEnvironment& env);

    /**
     * @brief Konfiguráció betöltése. A fájlrendszerhez nem nyúl; a relatív
     * --workdir a megadott cwd-hez képest oldódik fel.
     */
    Core::StepResult loadConfig(const std::vector<std::string>& args,
                                const Core::ProcessEnvironment& env,
                                const std::filesystem::path& cwd,
                                BootstrapConfig& out);

    /**
     * @brief A munkakönyvtárnak már léteznie kell. Ha nem könyvtár (vagy nem
     * vizsgálható), az használati hiba: elgépelt --workdir alá nem építünk fát.
     */
    Core::StepResult checkWorkingDirectory(const BootstrapConfig& config,
                                           const Core::FileSystem& fileSystem);

    Core::RunContext makeRunContext(const BootstrapConfig& config);

    /**
     * @brief Futtatható állomány keresése, execvp szemantikával:
     * '/' a névben -> közvetlen útvonal, különben a searchPath elemei sorban.
     */
    std::optional<std::filesystem::path> resolveExecutable(const std::string& name,
                                                           const std::string& searchPath,
                                                           const Core::FileSystem& fileSystem);

    std::string usage(const std::string& program);
}

#endif
