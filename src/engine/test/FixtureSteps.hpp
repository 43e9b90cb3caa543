#pragma once

#include "ExecutionContext.hpp"
#include "ProvisionConfig.hpp"
#include "Step.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Ordered record of step invocations ("run:a", "rollback:a"), shared by fixture steps
class Journal {
public:
    void add(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    size_t count(const std::string& entry) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : entries_) {
            if (e == entry) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

// Step that journals its calls and owns one ledger entry named after itself.
// rollback() only journals and erases when run() recorded the entry, so it is idempotent.
class RecordingStep : public Step {
public:
    RecordingStep(std::string name, std::shared_ptr<Journal> journal, std::vector<std::string> depends = {})
        : name_(std::move(name)), journal_(std::move(journal)), depends_(std::move(depends)) {}

    RecordingStep& fail_run(const std::string& message) { run_error_ = message; return *this; }
    RecordingStep& fail_rollback(const std::string& message) { rollback_error_ = message; return *this; }
    RecordingStep& cancel_after_run(const ExecutionContext& ctx) { cancel_after_run_ = ctx; return *this; }
    RecordingStep& sleep_in_run(ExecutionContext::Clock::duration duration) { sleep_ = duration; return *this; }

    void run(const ExecutionContext& ctx, std::ostream& out, ProvisionConfig& cfg) const override {
        journal_->add("run:" + name_);
        out << "running " << name_ << std::endl;
        if (sleep_) {
            ctx.sleep_for(*sleep_);
        }
        if (run_error_) {
            throw std::runtime_error(*run_error_);
        }
        cfg.created_resources.insert(name_);
        if (cancel_after_run_) {
            cancel_after_run_->cancel("cancelled by test");
        }
    }

    void rollback(const ExecutionContext&, std::ostream& out, ProvisionConfig& cfg) const override {
        if (!cfg.created(name_)) {
            return;
        }
        journal_->add("rollback:" + name_);
        out << "rolling back " << name_ << std::endl;
        if (rollback_error_) {
            throw std::runtime_error(*rollback_error_);
        }
        cfg.created_resources.erase(name_);
    }

    std::string name() const override { return name_; }
    std::string description() const override { return "fixture step " + name_; }
    std::vector<std::string> depends() const override { return depends_; }

private:
    std::string name_;
    std::shared_ptr<Journal> journal_;
    std::vector<std::string> depends_;
    std::optional<std::string> run_error_;
    std::optional<std::string> rollback_error_;
    std::optional<ExecutionContext> cancel_after_run_;
    std::optional<ExecutionContext::Clock::duration> sleep_;
};

inline std::shared_ptr<RecordingStep> make_step(const std::string& name, const std::shared_ptr<Journal>& journal,
                                                std::vector<std::string> depends = {}) {
    return std::make_shared<RecordingStep>(name, journal, std::move(depends));
}
