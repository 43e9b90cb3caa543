#pragma once

#include <optional>
#include <string>

// Sets an environment variable for the lifetime of the object
class ScopedEnvVar {
public:
    explicit ScopedEnvVar(const std::string& name, const std::string& new_value);

    ~ScopedEnvVar();

    void restore();

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    std::optional<std::string> old_value_;
    bool restored_ = false;
};
