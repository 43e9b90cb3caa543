#include "ProvisionError.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Configuration: return "configuration error";
        case ErrorKind::StepExecution: return "step execution error";
        case ErrorKind::Cancelled:     return "cancelled";
    }
    return "unknown";
}

std::string wrap_error(const std::string& context, const std::string& message) {
    if (context.empty()) return message;
    if (message.empty()) return context;
    return context + ": " + message;
}
