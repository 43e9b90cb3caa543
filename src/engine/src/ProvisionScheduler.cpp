#include "ProvisionScheduler.hpp"
#include "LogStream.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <chrono>

ProvisionScheduler::ProvisionScheduler(const ConfigData& config, const StepRegistry& registry)
    : ProvisionScheduler(config, registry, std::make_shared<ProductionStepStrategy>()) {
}

ProvisionScheduler::ProvisionScheduler(const ConfigData& config, const StepRegistry& registry,
                                       std::shared_ptr<const StepExecutionStrategy> strategy)
    : config_(config),
      executor_(std::move(strategy), config.global.rollback_timeout),
      reports_(config.jobs.size()) {

    for (const auto& job : config.jobs) {
        Pipeline pipeline;
        pipeline.name = job.name;
        for (const auto& name : job.steps) {
            auto step = registry.get_step(name);
            if (!step) {
                throw ConfigurationError("cluster " + job.name + ": unknown step " + name);
            }
            pipeline.steps.push_back(std::move(step));
        }
        pipelines_.push_back(std::move(pipeline));
    }
}

bool ProvisionScheduler::run(const ExecutionContext& root, const std::function<bool()>& stop_requested) {
    jobs_ctx_ = root.with_cancel();
    remaining_jobs_ = config_.jobs.size();
    failures_ = 0;

    for (size_t i = 0; i < config_.jobs.size(); ++i) {
        queue_.enqueue(i);
    }
    queue_.stop();

    // Create thread pool
    const size_t concurrency = std::max(1, config_.concurrency);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < std::min(concurrency, config_.jobs.size()); ++i) {
        workers.emplace_back([this] { worker_loop(); });
    }

    // Wait for all jobs to complete, watching for an external stop request
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        while (remaining_jobs_.load() > 0) {
            done_cv_.wait_for(lock, std::chrono::milliseconds(100));
            if (stop_requested && !jobs_ctx_.is_cancelled() && stop_requested()) {
                LogUtils::warn("Stop requested, cancelling {} running job(s)", remaining_jobs_.load());
                jobs_ctx_.cancel("interrupted");
            }
        }
    }

    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    return failures_.load() == 0;
}

void ProvisionScheduler::worker_loop() {
    while (auto index = queue_.dequeue()) {
        run_job(*index);

        size_t left = remaining_jobs_.fetch_sub(1);
        if (left == 1) {
            std::unique_lock<std::mutex> lock(done_mutex_);
            done_cv_.notify_all();
        }
    }
}

void ProvisionScheduler::run_job(size_t index) {
    const ClusterJob& job = config_.jobs[index];
    JobReport& report = reports_[index];
    report.key = job.key;
    report.cluster = job.name;

    ProvisionConfig cfg = job.config;
    cfg.poll_interval = config_.global.poll_interval;
    cfg.rollback_timeout = config_.global.rollback_timeout;

    const ExecutionContext ctx = jobs_ctx_.with_timeout(job.timeout);
    LogStream out(job.name);

    LogUtils::info("Provisioning cluster {} on {} ({} step(s))",
                   job.name, to_string(cfg.provider), pipelines_[index].size());

    report.result = executor_.run(pipelines_[index], ctx, out, &cfg);
    report.transcript = out.lines();

    if (report.result.ok()) {
        LogUtils::info("Cluster {} provisioned successfully", job.name);
        return;
    }

    failures_.fetch_add(1);
    LogUtils::error("Cluster {} failed:\n{}", job.name, report.result.report());

    if (config_.global.fail_fast) {
        jobs_ctx_.cancel("fail-fast: cluster " + job.name + " failed");
    }
}
