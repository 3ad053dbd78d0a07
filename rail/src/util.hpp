#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_unix_seconds();
    std::string trim(const std::string& str);
    std::string to_lower(std::string str);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);

    // Redaction for anything that may reach logs or replies
    std::string mask_url(const std::string& url);
    std::string mask_address(const std::string& address);
    std::string mask_secret(const std::string& secret);
}
