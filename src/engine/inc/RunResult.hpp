#pragma once

#include "ProvisionError.hpp"
#include <string>
#include <vector>

struct RollbackFailure {
    std::string step;
    std::string message;
};

// Outcome of running one pipeline
struct RunResult {
    std::string stage;                       // Pipeline or composite stage name
    ErrorKind kind = ErrorKind::None;
    std::string failed_step;                 // Step whose run() threw
    std::string interrupted_before;          // First step skipped because the context ended
    std::string message;                     // Wrapped chain, "<stage>: <step>: <cause>"
    std::vector<std::string> chain;          // Links of `message`, outermost first
    std::vector<std::string> completed;      // Steps whose run() succeeded, in order
    std::vector<std::string> rolled_back;    // Steps rolled back, in rollback order
    std::vector<RollbackFailure> rollback_failures;

    bool ok() const { return kind == ErrorKind::None; }

    // Multi-line summary for operators
    std::string report() const;

    // Throws PipelineError when the run failed
    void throw_if_failed() const;
};

class PipelineError : public ProvisionError {
public:
    explicit PipelineError(RunResult result)
        : ProvisionError(result.kind, result.message), result_(std::move(result)) {}

    const RunResult& result() const { return result_; }

private:
    RunResult result_;
};
