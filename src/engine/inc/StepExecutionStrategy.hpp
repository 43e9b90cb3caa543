#pragma once

#include "ExecutionContext.hpp"
#include "ProvisionConfig.hpp"
#include "Step.hpp"
#include <ostream>


// Abstract base class: how the executor invokes a single step
class StepExecutionStrategy {
public:
    virtual ~StepExecutionStrategy() = default;

    // Both rethrow whatever the step threw
    virtual void run(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;
    virtual void rollback(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const = 0;
};

// Production strategy: invoke the step and log timing
class ProductionStepStrategy : public StepExecutionStrategy {
public:
    void run(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void rollback(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
};

// Dry-run strategy: narrate the plan, expanding composite steps, without calling any cloud API
class DryRunStepStrategy : public StepExecutionStrategy {
public:
    void run(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;
    void rollback(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override;

private:
    void describe(const Step& step, std::ostream& out, const ProvisionConfig& cfg, int depth) const;
};
