#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);
};
