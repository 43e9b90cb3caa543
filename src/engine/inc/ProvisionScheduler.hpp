#pragma once

#include <vector>
#include <thread>
#include <memory>
#include <atomic>
#include <functional>
#include <mutex>
#include <condition_variable>

#include "ConfigData.hpp"
#include "ExecutionContext.hpp"
#include "PipelineExecutor.hpp"
#include "StepRegistry.hpp"
#include "ThreadSafeQueue.hpp"

struct JobReport {
    std::string key;
    std::string cluster;
    RunResult result;
    std::vector<std::string> transcript;   // Progress lines written by the steps
};

// Runs one pipeline per cluster job on a pool of worker threads.
// Each run owns its configuration copy, output sink and context; nothing is shared between runs
// except the read-only registry.
class ProvisionScheduler {
public:
    // Throws ConfigurationError when a job names an unregistered step
    ProvisionScheduler(const ConfigData& config, const StepRegistry& registry);

    ProvisionScheduler(const ConfigData& config, const StepRegistry& registry,
                       std::shared_ptr<const StepExecutionStrategy> strategy);

    static std::unique_ptr<ProvisionScheduler> create_dry_run(const ConfigData& config, const StepRegistry& registry) {
        return std::make_unique<ProvisionScheduler>(
            config, registry, std::make_shared<DryRunStepStrategy>()
        );
    }

    // Blocks until every job finished. `stop_requested` is polled while waiting;
    // when it returns true all running jobs are cancelled and roll back.
    bool run(const ExecutionContext& root, const std::function<bool()>& stop_requested = {});

    bool has_failure() const { return failures_.load() > 0; }
    const std::vector<JobReport>& reports() const { return reports_; }

private:
    void worker_loop();
    void run_job(size_t index);

    const ConfigData& config_;
    std::vector<Pipeline> pipelines_;                       // One per job, same order
    PipelineExecutor executor_;
    ThreadSafeQueue<size_t> queue_;
    std::vector<JobReport> reports_;
    ExecutionContext jobs_ctx_;

    std::atomic<size_t> remaining_jobs_{0};
    std::atomic<size_t> failures_{0};
    std::mutex done_mutex_;
    std::condition_variable done_cv_;
};
