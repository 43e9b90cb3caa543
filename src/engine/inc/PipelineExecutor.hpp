#pragma once

#include "ExecutionContext.hpp"
#include "Pipeline.hpp"
#include "PipelineCatalog.hpp"
#include "ProvisionConfig.hpp"
#include "RunResult.hpp"
#include "StepExecutionStrategy.hpp"
#include <chrono>
#include <memory>
#include <ostream>
#include <vector>

// Runs a pipeline's steps one after another against a single configuration.
// The first failure stops forward execution and every step that completed is
// rolled back, most recent first.
class PipelineExecutor {
public:
    static constexpr std::chrono::seconds DEFAULT_ROLLBACK_TIMEOUT{600};

    PipelineExecutor();
    explicit PipelineExecutor(std::shared_ptr<const StepExecutionStrategy> strategy,
                              std::chrono::seconds rollback_timeout = DEFAULT_ROLLBACK_TIMEOUT);

    RunResult run(const Pipeline& pipeline, const ExecutionContext& ctx,
                  std::ostream& out, ProvisionConfig* cfg) const;

    // Resolves the catalog pipeline for `provider` first; resolution problems
    // fail the run before any step is invoked
    RunResult run(CloudProvider provider, const PipelineCatalog& catalog, const StepRegistry& registry,
                  const ExecutionContext& ctx, std::ostream& out, ProvisionConfig* cfg) const;

    // Rolls back `completed` (given in run order) in reverse. Rollback failures
    // are collected, never rethrown, and never stop the walk. Runs under a
    // context detached from `ctx` so a cancelled run still cleans up.
    std::vector<RollbackFailure> compensate(const std::vector<StepPtr>& completed,
                                            const ExecutionContext& ctx,
                                            std::ostream& out,
                                            ProvisionConfig& cfg,
                                            std::vector<std::string>* rolled_back = nullptr) const;

    const StepExecutionStrategy& strategy() const { return *strategy_; }
    std::chrono::seconds rollback_timeout() const { return rollback_timeout_; }

private:
    std::shared_ptr<const StepExecutionStrategy> strategy_;
    std::chrono::seconds rollback_timeout_;
};
