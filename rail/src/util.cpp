#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string mask_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return "***";
    }

    std::string scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    // Query strings and fragments routinely carry API keys
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) {
        rest = rest.substr(0, cut);
    }

    auto path_start = rest.find('/');
    std::string netloc = path_start == std::string::npos ? rest : rest.substr(0, path_start);
    std::string path = path_start == std::string::npos ? "" : rest.substr(path_start);

    auto at = netloc.rfind('@');
    if (at != std::string::npos) {
        netloc = netloc.substr(at + 1);
    }

    if (netloc.size() > 10) {
        netloc = netloc.substr(0, 4) + "..." + netloc.substr(netloc.size() - 4);
    }

    // Infura/Alchemy style keys live in the last path segment
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    auto segment_start = path.rfind('/') + 1;
    if (path.size() - segment_start > 8) {
        path = path.substr(0, segment_start + 4) + "...";
    }
    if (path.size() > 24) {
        path = path.substr(0, 8) + "...";
    }

    return scheme + "://" + netloc + path;
}

std::string mask_address(const std::string& address) {
    if (address.size() < 10) {
        return "***";
    }
    return address.substr(0, 6) + "..." + address.substr(address.size() - 4);
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() < 8) {
        return "***";
    }
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

} // namespace util
