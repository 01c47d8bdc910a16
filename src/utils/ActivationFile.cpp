#include "utils/ActivationFile.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"
#include <fstream>

namespace PreflightUtils {

    std::vector<std::string> activationExports(const Preflight::Core::IsolatedEnvironment& active,
                                               const Preflight::Core::ProcessEnvironment& env) {
        std::vector<std::string> lines;
        lines.push_back("# Generated by preflight; source this file to activate " + active.name);
        lines.push_back("export " + PreflightTemplates::VIRTUAL_ENV_VAR + "=" + shellQuote(active.root.string()));

        auto path = env.get(PreflightTemplates::PATH_VAR);
        if (path) {
            lines.push_back("export " + PreflightTemplates::PATH_VAR + "=" + shellQuote(*path));
        }
        lines.push_back("unset " + PreflightTemplates::PYTHONHOME_VAR);
        return lines;
    }

    bool writeTextFile(const std::string& path, const std::vector<std::string>& content) {
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) return false;
        for (const auto& l : content) file << l << "\n";
        file.close();
        return !file.fail();
    }
}
