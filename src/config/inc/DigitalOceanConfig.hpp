#pragma once
#include <string>

struct DigitalOceanConfig {
    std::string access_token;
    std::string region = "fra1";
};
