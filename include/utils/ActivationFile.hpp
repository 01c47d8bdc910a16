#ifndef ACTIVATION_FILE_HPP
#define ACTIVATION_FILE_HPP

#include <string>
#include <vector>
#include "core/ProcessEnvironment.hpp"
#include "core/RunContext.hpp"

namespace PreflightUtils {

    // "export KEY='value'" sorok az aktivált környezetből, a hívó shell source-olhatja
    std::vector<std::string> activationExports(const Preflight::Core::IsolatedEnvironment& active,
                                               const Preflight::Core::ProcessEnvironment& env);

    // Fájl írása (felülírás)
    bool writeTextFile(const std::string& path, const std::vector<std::string>& content);
}

#endif
