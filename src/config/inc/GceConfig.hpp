#pragma once
#include <string>

struct GceConfig {
    std::string project_id;
    std::string service_account_file;
    std::string region = "us-central1";
};
