#include "StepExecutionStrategy.hpp"
#include "CompositeStep.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <chrono>
#include <string>

namespace {

long long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

}

// Implementation of production strategy
void ProductionStepStrategy::run(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    LogUtils::info("Executing step: {} ({}) for cluster {}", step.name(), step.description(), cfg.cluster_name);
    const auto start = std::chrono::steady_clock::now();

    try {
        step.run(ctx, out, cfg);
    } catch (const std::exception& e) {
        LogUtils::error("Error executing step: {}, reason: \"{}\"", step.name(), e.what());
        throw;
    }

    LogUtils::info("Step completed: {} in {} ms", step.name(), elapsed_ms(start));
}

void ProductionStepStrategy::rollback(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    LogUtils::info("Rolling back step: {} for cluster {}", step.name(), cfg.cluster_name);
    const auto start = std::chrono::steady_clock::now();

    try {
        step.rollback(ctx, out, cfg);
    } catch (const std::exception& e) {
        LogUtils::error("Error rolling back step: {}, reason: \"{}\"", step.name(), e.what());
        throw;
    }

    LogUtils::info("Rollback completed: {} in {} ms", step.name(), elapsed_ms(start));
}


// Implementation of dry-run strategy
void DryRunStepStrategy::run(const Step& step, const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const {
    ctx.check();
    describe(step, out, cfg, 0);
}

void DryRunStepStrategy::rollback(const Step& step, const ExecutionContext&, std::ostream& out, ProvisionConfig&) const {
    out << "[dry-run] would roll back " << step.name() << std::endl;
}

void DryRunStepStrategy::describe(const Step& step, std::ostream& out, const ProvisionConfig& cfg, int depth) const {
    out << "[dry-run] " << std::string(depth * 2, ' ') << "would run " << step.name();
    if (step.description() != step.name()) {
        out << " - " << step.description();
    }
    const auto depends = step.depends();
    if (!depends.empty()) {
        out << " (after " << StringUtils::join(depends, ", ") << ")";
    }
    out << std::endl;

    if (const auto* composite = dynamic_cast<const CompositeStep*>(&step)) {
        const Pipeline inner = composite->resolve(cfg);
        if (inner.empty()) {
            out << "[dry-run] " << std::string((depth + 1) * 2, ' ') << "no steps for "
                << to_string(cfg.provider) << std::endl;
        }
        for (const auto& child : inner.steps) {
            describe(*child, out, cfg, depth + 1);
        }
    }
}
