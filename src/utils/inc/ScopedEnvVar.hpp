#pragma once

#include <optional>
#include <string>

// Sets (or with std::nullopt, unsets) an environment variable for the lifetime of the object.
class ScopedEnvVar {
private:
    std::string name_;
    std::optional<std::string> old_value_;
    bool restored_ = false;

public:
    ScopedEnvVar(const std::string& name, const std::optional<std::string>& new_value);

    ~ScopedEnvVar();

    void restore();

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;
};
