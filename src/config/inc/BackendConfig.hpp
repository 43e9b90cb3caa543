#pragma once
#include <string>
#include <vector>

// Cloud API backend the provider steps talk to
struct BackendConfig {
    enum class Type {
        Sandbox
    } type = Type::Sandbox;

    size_t latency_polls = 1;            // polls before an asynchronous resource becomes ready
    std::vector<std::string> fail_on;    // operations that fail in the sandbox
};
