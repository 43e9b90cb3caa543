#pragma once

#include "PipelineExecutor.hpp"
#include "Step.hpp"

// A step made of a nested pipeline, run by the same executor as top-level
// pipelines so compensation happens at every nesting level.
//
// run() throws PipelineError after the inner steps have been rolled back.
// rollback() undoes every inner step in reverse order; inner rollbacks are
// idempotent, so steps that never ran are skipped by the steps themselves.
class CompositeStep : public Step {
public:
    CompositeStep();
    explicit CompositeStep(PipelineExecutor executor);

    void run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void rollback(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;

    // Inner pipeline for this configuration; throws ConfigurationError when it cannot be built
    virtual Pipeline resolve(const ProvisionConfig& cfg) const = 0;

protected:
    const PipelineExecutor& executor() const { return executor_; }

private:
    PipelineExecutor executor_;
};
