#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Cancellation and deadline signal shared by every step of a run.
//
// Copies share state. Children created with with_timeout()/with_cancel() are
// cancelled together with their parent; cancelling a child leaves the parent
// untouched.
class ExecutionContext {
public:
    using Clock = std::chrono::steady_clock;

    ExecutionContext();

    ExecutionContext with_cancel() const;
    ExecutionContext with_timeout(Clock::duration timeout) const;
    ExecutionContext with_deadline(Clock::time_point deadline) const;

    // Fresh root bounded only by `timeout`; used for teardown after cancellation
    ExecutionContext detached(Clock::duration timeout) const;

    void cancel(const std::string& reason = "context cancelled") const;
    bool is_cancelled() const;
    std::string reason() const;
    std::optional<Clock::time_point> deadline() const;

    // Throws CancelledError when cancelled or past the deadline
    void check() const;

    // Interruptible wait for polling loops; throws CancelledError as soon as the context ends
    void sleep_for(Clock::duration duration) const;

private:
    struct State;

    explicit ExecutionContext(std::shared_ptr<State> state);
    ExecutionContext make_child(std::optional<Clock::time_point> deadline) const;

    std::shared_ptr<State> state_;
};
