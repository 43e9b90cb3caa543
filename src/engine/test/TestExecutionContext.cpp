#include "ExecutionContext.hpp"
#include "ProvisionError.hpp"
#include <cassert>
#include <iostream>
#include <thread>

void test_cancel_propagates_to_children() {
    ExecutionContext root;
    ExecutionContext child = root.with_cancel();
    ExecutionContext grandchild = child.with_timeout(std::chrono::hours(1));

    assert(!grandchild.is_cancelled());
    root.cancel("interrupted");
    assert(child.is_cancelled());
    assert(grandchild.is_cancelled());
    assert(grandchild.reason() == "interrupted");
    std::cout << "test_cancel_propagates_to_children passed" << std::endl;
}

void test_child_cancel_leaves_parent() {
    ExecutionContext root;
    ExecutionContext child = root.with_cancel();
    child.cancel("job failed");

    assert(child.is_cancelled());
    assert(!root.is_cancelled());
    std::cout << "test_child_cancel_leaves_parent passed" << std::endl;
}

void test_child_of_cancelled_parent_starts_cancelled() {
    ExecutionContext root;
    root.cancel("stopped");
    ExecutionContext child = root.with_timeout(std::chrono::seconds(10));

    assert(child.is_cancelled());
    assert(child.reason() == "stopped");
    std::cout << "test_child_of_cancelled_parent_starts_cancelled passed" << std::endl;
}

void test_deadline_exceeded() {
    ExecutionContext ctx = ExecutionContext().with_timeout(std::chrono::milliseconds(10));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    assert(ctx.is_cancelled());
    assert(ctx.reason() == "deadline exceeded");

    bool threw = false;
    try {
        ctx.check();
    } catch (const CancelledError& e) {
        threw = std::string(e.what()) == "deadline exceeded" && e.kind() == ErrorKind::Cancelled;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_deadline_exceeded passed" << std::endl;
}

void test_child_inherits_earlier_deadline() {
    ExecutionContext parent = ExecutionContext().with_timeout(std::chrono::seconds(1));
    ExecutionContext child = parent.with_timeout(std::chrono::hours(1));

    assert(child.deadline().has_value());
    assert(*child.deadline() == *parent.deadline());
    std::cout << "test_child_inherits_earlier_deadline passed" << std::endl;
}

void test_sleep_interrupted_by_cancel() {
    ExecutionContext ctx;
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ctx.cancel("shutdown");
    });

    const auto start = std::chrono::steady_clock::now();
    bool threw = false;
    try {
        ctx.sleep_for(std::chrono::seconds(30));
    } catch (const CancelledError& e) {
        threw = std::string(e.what()) == "shutdown";
    }
    canceller.join();

    (void)threw;
    assert(threw);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    std::cout << "test_sleep_interrupted_by_cancel passed" << std::endl;
}

void test_sleep_completes() {
    ExecutionContext ctx;
    ctx.sleep_for(std::chrono::milliseconds(5));
    assert(!ctx.is_cancelled());
    std::cout << "test_sleep_completes passed" << std::endl;
}

void test_detached_ignores_parent() {
    ExecutionContext root;
    root.cancel("interrupted");
    ExecutionContext teardown = root.detached(std::chrono::seconds(60));

    assert(!teardown.is_cancelled());
    teardown.check();
    assert(teardown.deadline().has_value());
    std::cout << "test_detached_ignores_parent passed" << std::endl;
}

int main() {
    test_cancel_propagates_to_children();
    test_child_cancel_leaves_parent();
    test_child_of_cancelled_parent_starts_cancelled();
    test_deadline_exceeded();
    test_child_inherits_earlier_deadline();
    test_sleep_interrupted_by_cancel();
    test_sleep_completes();
    test_detached_ignores_parent();

    std::cout << "All ExecutionContext tests passed!" << std::endl;
    return 0;
}
