#pragma once

#include <chrono>
#include <string>

struct GlobalConfig {
    bool verbose = false;
    bool dry_run = false;
    bool fail_fast = false;
    std::string log_dir = "log/";
    std::string log_level = "info";
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::seconds rollback_timeout{600};
};
