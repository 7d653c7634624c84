#pragma once
#include <string>

namespace util {
    void setup_logging(const std::string& level);
    std::string current_iso8601();
    std::string trim(const std::string& value);
    std::string to_lower(const std::string& value);
}
