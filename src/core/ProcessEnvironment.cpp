#include "core/ProcessEnvironment.hpp"
#include <cstdlib>

namespace Preflight::Core {

std::optional<std::string> PosixEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

bool PosixEnvironment::set(const std::string& name, const std::string& value) {
    return setenv(name.c_str(), value.c_str(), 1) == 0;
}

bool PosixEnvironment::unset(const std::string& name) {
    return unsetenv(name.c_str()) == 0;
}

} // namespace Preflight::Core
