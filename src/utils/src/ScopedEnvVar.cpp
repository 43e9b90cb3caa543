#include "ScopedEnvVar.hpp"
#include "LogUtils.hpp"
#include <cstdlib>
#include <stdexcept>

ScopedEnvVar::ScopedEnvVar(const std::string& name, const std::string& new_value)
    : name_(name) {

    if (name_.empty()) {
        throw std::invalid_argument("ScopedEnvVar: environment variable name cannot be empty");
    }

    if (const char* old = std::getenv(name_.c_str())) {
        old_value_ = old;
    }

    if (setenv(name_.c_str(), new_value.c_str(), 1) != 0) {
        throw std::runtime_error("ScopedEnvVar: setenv failed for " + name_);
    }
}

ScopedEnvVar::~ScopedEnvVar() {
    try {
        restore();
    } catch (const std::exception& e) {
        LogUtils::warn("Failed to restore environment variable {}: {}", name_, e.what());
    }
}

void ScopedEnvVar::restore() {
    if (restored_) {
        return;
    }
    restored_ = true;

    if (old_value_) {
        if (setenv(name_.c_str(), old_value_->c_str(), 1) != 0) {
            throw std::runtime_error("ScopedEnvVar: setenv failed (restore old) for " + name_);
        }
    } else if (unsetenv(name_.c_str()) != 0) {
        throw std::runtime_error("ScopedEnvVar: unsetenv failed for " + name_);
    }
}
