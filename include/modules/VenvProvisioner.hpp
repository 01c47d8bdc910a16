// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef VENV_PROVISIONER_HPP
#define VENV_PROVISIONER_HPP

#include <filesystem>
#include <string>
#include "core/FileSystem.hpp"
#include "core/StepResult.hpp"

namespace Preflight::Modules {

    /**
     * @brief Új izolált környezet létrehozása a megadott gyökérben.
     */
    class EnvironmentProvisioner {
    public:
        virtual ~EnvironmentProvisioner() = default;
        virtual std::string describe() const = 0;
        virtual Core::StepResult provision(const std::filesystem::path& root) = 0;
    };

    /**
     * @brief `<python> -m venv <root>` futtatása a SafeExecutor-ral (fork/execv, shell nélkül).
     * Az interpretert a keresési útvonalon oldja fel, mint az execvp.
     */
    class VenvProvisioner final : public EnvironmentProvisioner {
    public:
        VenvProvisioner(const Core::FileSystem& fsRef, std::string interpreter, std::string searchPath);

        std::string describe() const override { return interpreter + " -m venv"; }
        Core::StepResult provision(const std::filesystem::path& root) override;

    private:
        const Core::FileSystem& fs;
        std::string interpreter;
        std::string searchPath;
    };
}

#endif
