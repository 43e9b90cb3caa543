#include "CompositeStep.hpp"

CompositeStep::CompositeStep() = default;

CompositeStep::CompositeStep(PipelineExecutor executor) : executor_(std::move(executor)) {}

void CompositeStep::run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    const Pipeline pipeline = resolve(cfg);
    executor_.run(pipeline, ctx, out, &cfg).throw_if_failed();
}

void CompositeStep::rollback(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    const Pipeline pipeline = resolve(cfg);

    RunResult result;
    result.stage = pipeline.name;
    result.rollback_failures = executor_.compensate(pipeline.steps, ctx, out, cfg, &result.rolled_back);
    if (result.rollback_failures.empty()) {
        return;
    }

    result.kind = ErrorKind::StepExecution;
    result.chain = {pipeline.name, "rollback failed for " + std::to_string(result.rollback_failures.size()) + " step(s)"};
    result.message = result.chain[0] + ": " + result.chain[1];
    throw PipelineError(result);
}
