#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace NetUtils {

struct Cidr {
    uint32_t network = 0;   // host byte order, host bits cleared
    int prefix = 0;
};

// Parses "a.b.c.d/n"; throws std::invalid_argument on malformed input
Cidr parse_cidr(const std::string& text);

std::string to_string(const Cidr& cidr);

// Splits `range` into `count` consecutive blocks of size /new_prefix
std::vector<std::string> carve_subnets(const std::string& range, size_t count, int new_prefix);

// Smallest prefix that fits `count` blocks into `range`, but never larger blocks than /24 when possible
int subnet_prefix_for(const std::string& range, size_t count);

}
