#include "PipelineExecutor.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

namespace {

void fail(RunResult& result, ErrorKind kind, std::vector<std::string> chain) {
    result.kind = kind;
    result.chain = std::move(chain);
    result.message = StringUtils::join(result.chain, ": ");
}

// Inner pipelines already carry their own stage name; do not repeat it
void fail_nested(RunResult& result, const std::string& step_name, const PipelineError& nested) {
    const RunResult& inner = nested.result();

    std::vector<std::string> chain{result.stage};
    if (inner.stage != step_name) {
        chain.push_back(step_name);
    }
    chain.insert(chain.end(), inner.chain.begin(), inner.chain.end());
    fail(result, inner.kind, std::move(chain));

    for (const auto& name : inner.rolled_back) {
        result.rolled_back.push_back(wrap_error(inner.stage, name));
    }
    for (const auto& failure : inner.rollback_failures) {
        result.rollback_failures.push_back({wrap_error(inner.stage, failure.step), failure.message});
    }
}

}

PipelineExecutor::PipelineExecutor()
    : PipelineExecutor(std::make_shared<ProductionStepStrategy>()) {
}

PipelineExecutor::PipelineExecutor(std::shared_ptr<const StepExecutionStrategy> strategy,
                                   std::chrono::seconds rollback_timeout)
    : strategy_(std::move(strategy)), rollback_timeout_(rollback_timeout) {
    if (!strategy_) {
        throw std::invalid_argument("PipelineExecutor requires a step execution strategy");
    }
}

RunResult PipelineExecutor::run(const Pipeline& pipeline, const ExecutionContext& ctx,
                                std::ostream& out, ProvisionConfig* cfg) const {
    RunResult result;
    result.stage = pipeline.name;

    if (cfg == nullptr) {
        fail(result, ErrorKind::Configuration, {pipeline.name, "invalid config"});
        LogUtils::error("Pipeline {} rejected: {}", pipeline.name, result.message);
        return result;
    }

    if (pipeline.empty()) {
        LogUtils::info("Pipeline {} has no steps for cluster {}", pipeline.name, cfg->cluster_name);
        return result;
    }

    std::vector<StepPtr> completed;
    for (const auto& step : pipeline.steps) {
        const std::string name = step->name();

        if (ctx.is_cancelled()) {
            result.interrupted_before = name;
            fail(result, ErrorKind::Cancelled, {pipeline.name, ctx.reason()});
            break;
        }

        try {
            strategy_->run(*step, ctx, out, *cfg);
            completed.push_back(step);
            result.completed.push_back(name);
            continue;
        } catch (const PipelineError& e) {
            fail_nested(result, name, e);
        } catch (const ProvisionError& e) {
            fail(result, e.kind(), {pipeline.name, name, e.what()});
        } catch (const std::exception& e) {
            fail(result, ErrorKind::StepExecution, {pipeline.name, name, e.what()});
        }

        result.failed_step = name;
        break;
    }

    if (result.ok()) {
        return result;
    }

    LogUtils::error("Pipeline {} failed for cluster {}: {}", pipeline.name, cfg->cluster_name, result.message);
    if (!completed.empty()) {
        out << "Rolling back " << completed.size() << " completed step(s) of " << pipeline.name << std::endl;
        auto failures = compensate(completed, ctx, out, *cfg, &result.rolled_back);
        result.rollback_failures.insert(result.rollback_failures.end(), failures.begin(), failures.end());
    }
    return result;
}

RunResult PipelineExecutor::run(CloudProvider provider, const PipelineCatalog& catalog, const StepRegistry& registry,
                                const ExecutionContext& ctx, std::ostream& out, ProvisionConfig* cfg) const {
    Pipeline pipeline;
    try {
        pipeline = catalog.resolve(provider, registry);
    } catch (const ProvisionError& e) {
        RunResult result;
        result.stage = catalog.stage();
        fail(result, e.kind(), {catalog.stage(), e.what()});
        LogUtils::error("Pipeline {} could not be resolved: {}", catalog.stage(), result.message);
        return result;
    }
    return run(pipeline, ctx, out, cfg);
}

std::vector<RollbackFailure> PipelineExecutor::compensate(const std::vector<StepPtr>& completed,
                                                          const ExecutionContext& ctx,
                                                          std::ostream& out,
                                                          ProvisionConfig& cfg,
                                                          std::vector<std::string>* rolled_back) const {
    std::vector<RollbackFailure> failures;
    const ExecutionContext teardown = ctx.detached(rollback_timeout_);

    for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
        const auto& step = *it;
        const std::string name = step->name();

        try {
            strategy_->rollback(*step, teardown, out, cfg);
        } catch (const PipelineError& e) {
            failures.push_back({name, e.what()});
            for (const auto& inner : e.result().rollback_failures) {
                failures.push_back({wrap_error(name, inner.step), inner.message});
            }
            out << "Rollback of " << name << " failed: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            failures.push_back({name, e.what()});
            out << "Rollback of " << name << " failed: " << e.what() << std::endl;
        }

        if (rolled_back) {
            rolled_back->push_back(name);
        }
    }
    return failures;
}
