#include "ScopedEnvVar.hpp"
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string unique_env_name(const std::string& base) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return base + "_" + std::to_string(now);
}

bool has_env(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}
}

void test_empty_name_throws() {
    bool threw = false;
    try {
        ScopedEnvVar env("", "value");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_empty_name_throws passed\n";
}

void test_new_variable_removed_on_scope_exit() {
    const std::string name = unique_env_name("KUBEPROV_TEST_ENV_NEW");
    unsetenv(name.c_str());

    {
        ScopedEnvVar env(name, "new_value");
        assert(has_env(name));
        assert(std::string(std::getenv(name.c_str())) == "new_value");
    }

    assert(!has_env(name));
    std::cout << "test_new_variable_removed_on_scope_exit passed\n";
}

void test_previous_value_restored_once() {
    const std::string name = unique_env_name("KUBEPROV_TEST_ENV_OLD");
    setenv(name.c_str(), "old_value", 1);

    {
        ScopedEnvVar env(name, "new_value");
        assert(std::string(std::getenv(name.c_str())) == "new_value");

        env.restore();
        assert(std::string(std::getenv(name.c_str())) == "old_value");

        // A later change survives scope exit, restore already happened
        setenv(name.c_str(), "changed_later", 1);
    }

    assert(std::string(std::getenv(name.c_str())) == "changed_later");
    unsetenv(name.c_str());
    std::cout << "test_previous_value_restored_once passed\n";
}

int main() {
    test_empty_name_throws();
    test_new_variable_removed_on_scope_exit();
    test_previous_value_restored_once();

    std::cout << "All ScopedEnvVar tests passed.\n";
    return 0;
}
