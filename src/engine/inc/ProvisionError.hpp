#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    None,
    Configuration,   // deployment or build defect, never retried
    StepExecution,   // a step's forward action failed
    Cancelled        // the caller gave up or a deadline passed
};

const char* to_string(ErrorKind kind);

class ProvisionError : public std::runtime_error {
public:
    ProvisionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public ProvisionError {
public:
    explicit ConfigurationError(const std::string& message)
        : ProvisionError(ErrorKind::Configuration, message) {}
};

class CancelledError : public ProvisionError {
public:
    explicit CancelledError(const std::string& message)
        : ProvisionError(ErrorKind::Cancelled, message) {}
};

// "<context>: <message>"
std::string wrap_error(const std::string& context, const std::string& message);
