#pragma once

#include <optional>
#include <string>

namespace Preflight::Core {

/**
 * @brief A folyamat környezeti változóinak absztrakciója.
 * Az aktiválás ezen keresztül írja a VIRTUAL_ENV/PATH párost.
 */
class ProcessEnvironment {
public:
    virtual ~ProcessEnvironment() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;
    virtual bool set(const std::string& name, const std::string& value) = 0;
    virtual bool unset(const std::string& name) = 0;
};

// getenv/setenv/unsetenv a valódi folyamatkörnyezeten
class PosixEnvironment final : public ProcessEnvironment {
public:
    std::optional<std::string> get(const std::string& name) const override;
    bool set(const std::string& name, const std::string& value) override;
    bool unset(const std::string& name) override;
};

} // namespace Preflight::Core
