#include "validators.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <ethash/keccak.hpp>
#include <cctype>
#include <fmt/format.h>

namespace validators {

namespace {

bool fail(std::string* reason, const char* why) {
    if (reason) *reason = why;
    return false;
}

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

uint64_t validate_chain_id(int64_t chain_id) {
    if (chain_id <= 0) {
        throw RailError(ErrorCode::InvalidInput,
                        fmt::format("Invalid chain ID: {}", chain_id),
                        "Chain ID must be a positive integer");
    }
    return static_cast<uint64_t>(chain_id);
}

bool is_valid_endpoint_url(const std::string& url, std::string* reason) {
    if (url.empty()) {
        return fail(reason, "empty URL");
    }
    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return fail(reason, "URL contains whitespace");
        }
    }
    if (url.find("${") != std::string::npos) {
        return fail(reason, "URL contains an unresolved ${...} placeholder");
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return fail(reason, "URL has no scheme");
    }
    std::string scheme = util::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return fail(reason, "scheme must be http or https");
    }

    std::string rest = url.substr(scheme_end + 3);
    std::string netloc = rest.substr(0, rest.find_first_of("/?#"));

    auto at = netloc.rfind('@');
    if (at != std::string::npos) {
        netloc = netloc.substr(at + 1);
    }

    std::string host = netloc;
    std::string port;
    if (!netloc.empty() && netloc[0] == '[') {
        auto close = netloc.find(']');
        if (close == std::string::npos) {
            return fail(reason, "unterminated IPv6 literal");
        }
        host = netloc.substr(0, close + 1);
        if (close + 1 < netloc.size()) {
            if (netloc[close + 1] != ':') {
                return fail(reason, "malformed host");
            }
            port = netloc.substr(close + 2);
            if (port.empty()) {
                return fail(reason, "empty port");
            }
        }
    } else {
        auto colon = netloc.find(':');
        if (colon != std::string::npos) {
            host = netloc.substr(0, colon);
            port = netloc.substr(colon + 1);
            if (port.empty()) {
                return fail(reason, "empty port");
            }
        }
    }

    if (host.empty()) {
        return fail(reason, "missing host");
    }

    if (!port.empty()) {
        if (port.size() > 5) {
            return fail(reason, "port out of range");
        }
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return fail(reason, "port must be numeric");
            }
        }
        int value = std::stoi(port);
        if (value <= 0 || value > 65535) {
            return fail(reason, "port out of range");
        }
    }

    return true;
}

std::string validate_endpoint_url(const std::string& url) {
    std::string reason;
    if (!is_valid_endpoint_url(url, &reason)) {
        throw RailError(ErrorCode::InvalidInput,
                        fmt::format("Invalid RPC URL {}: {}", util::mask_url(url), reason),
                        "URL must look like http(s)://host[:port][/path]");
    }
    return url;
}

bool is_valid_address(const std::string& address) {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    for (size_t i = 2; i < address.size(); i++) {
        if (!is_hex_digit(address[i])) return false;
    }
    return true;
}

std::string to_checksum_address(const std::string& address) {
    std::string hex = util::to_lower(address.substr(2));
    const auto hash = ethash::keccak256(reinterpret_cast<const uint8_t*>(hex.data()), hex.size());

    std::string out = "0x";
    for (size_t i = 0; i < hex.size(); i++) {
        char c = hex[i];
        uint8_t byte = hash.bytes[i / 2];
        uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0f);
        if (std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out += c;
    }
    return out;
}

std::string validate_address(const std::string& address, const std::string& param_name) {
    std::string trimmed = util::trim(address);
    if (!is_valid_address(trimmed)) {
        throw RailError(ErrorCode::InvalidInput,
                        fmt::format("Invalid {} format '{}'", param_name, util::mask_address(trimmed)),
                        "Address must be a valid 0x-prefixed hex string of 40 characters");
    }
    return to_checksum_address(trimmed);
}

} // namespace validators
