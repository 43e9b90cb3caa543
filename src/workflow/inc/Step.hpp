#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

class ExecutionContext;
struct ProvisionConfig;

// A named, reversible provisioning action.
//
// Instances are created once at start-up and shared by every run, so run() and
// rollback() must not keep per-run state in the object. Both report failure by
// throwing; progress goes to `out` as human-readable lines.
class Step {
public:
    virtual ~Step() = default;

    virtual void run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;

    // Best-effort inverse of run(). Must be a no-op when run() never created anything.
    virtual void rollback(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    // Steps that must have succeeded earlier in the same pipeline
    virtual std::vector<std::string> depends() const = 0;
};

using StepPtr = std::shared_ptr<const Step>;
