#include "ExecutionContext.hpp"
#include "ProvisionError.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

struct ExecutionContext::State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::string reason;
    std::optional<Clock::time_point> deadline;
    std::vector<std::weak_ptr<State>> children;

    void cancel(const std::string& why) {
        std::vector<std::weak_ptr<State>> to_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) return;
            cancelled = true;
            reason = why;
            to_cancel.swap(children);
        }
        cv.notify_all();

        for (auto& weak : to_cancel) {
            if (auto child = weak.lock()) {
                child->cancel(why);
            }
        }
    }

    // Deadlines are observed lazily, on the next query
    bool expired() {
        std::optional<Clock::time_point> limit;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) return true;
            limit = deadline;
        }
        if (limit && Clock::now() >= *limit) {
            cancel("deadline exceeded");
            return true;
        }
        return false;
    }
};

ExecutionContext::ExecutionContext() : state_(std::make_shared<State>()) {}

ExecutionContext::ExecutionContext(std::shared_ptr<State> state) : state_(std::move(state)) {}

ExecutionContext ExecutionContext::make_child(std::optional<Clock::time_point> deadline) const {
    auto child = std::make_shared<State>();

    bool parent_cancelled = false;
    std::string parent_reason;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->deadline && (!deadline || *state_->deadline < *deadline)) {
            deadline = state_->deadline;
        }
        if (state_->cancelled) {
            parent_cancelled = true;
            parent_reason = state_->reason;
        } else {
            // Drop links to children that already went away
            auto& links = state_->children;
            links.erase(std::remove_if(links.begin(), links.end(),
                                       [](const std::weak_ptr<State>& w) { return w.expired(); }),
                        links.end());
            links.push_back(child);
        }
    }

    child->deadline = deadline;
    if (parent_cancelled) {
        child->cancel(parent_reason);
    }
    return ExecutionContext(child);
}

ExecutionContext ExecutionContext::with_cancel() const {
    return make_child(std::nullopt);
}

ExecutionContext ExecutionContext::with_timeout(Clock::duration timeout) const {
    return make_child(Clock::now() + timeout);
}

ExecutionContext ExecutionContext::with_deadline(Clock::time_point deadline) const {
    return make_child(deadline);
}

ExecutionContext ExecutionContext::detached(Clock::duration timeout) const {
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    return ExecutionContext(state);
}

void ExecutionContext::cancel(const std::string& reason) const {
    state_->cancel(reason);
}

bool ExecutionContext::is_cancelled() const {
    return state_->expired();
}

std::string ExecutionContext::reason() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

std::optional<ExecutionContext::Clock::time_point> ExecutionContext::deadline() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

void ExecutionContext::check() const {
    if (is_cancelled()) {
        throw CancelledError(reason());
    }
}

void ExecutionContext::sleep_for(Clock::duration duration) const {
    auto wake_at = Clock::now() + duration;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->deadline && *state_->deadline < wake_at) {
            wake_at = *state_->deadline;
        }
        state_->cv.wait_until(lock, wake_at, [this] { return state_->cancelled; });
    }
    check();
}
