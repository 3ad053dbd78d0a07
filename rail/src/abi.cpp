#include "abi.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <fmt/format.h>

namespace abi {

namespace {

std::string strip_prefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string word_at(const std::string& body, size_t index) {
    size_t start = index * 64;
    if (body.size() < start + 64) {
        throw RailError(ErrorCode::ContractCallFailed, "ABI data too short");
    }
    return body.substr(start, 64);
}

uint64_t word_to_offset(const std::string& word) {
    // Offsets and lengths beyond 2^32 are never legitimate here
    for (size_t i = 0; i < 56; i++) {
        if (word[i] != '0') {
            throw RailError(ErrorCode::ContractCallFailed, "ABI offset out of range");
        }
    }
    uint64_t value = 0;
    for (size_t i = 56; i < 64; i++) {
        int nibble = hex_value(word[i]);
        if (nibble < 0) {
            throw RailError(ErrorCode::ContractCallFailed, "Invalid hex in ABI offset");
        }
        value = (value << 4) | static_cast<uint64_t>(nibble);
    }
    return value;
}

std::string bytes_from_hex(const std::string& hex) {
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw RailError(ErrorCode::ContractCallFailed, "ABI data is not hex");
        }
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

} // namespace

std::string encode_call(const std::string& selector) {
    return selector;
}

std::string encode_address_call(const std::string& selector, const std::string& address) {
    std::string hex = util::to_lower(strip_prefix(address));
    return selector + std::string(64 - hex.size(), '0') + hex;
}

std::string hex_to_decimal(const std::string& hex) {
    std::string body = strip_prefix(hex);
    if (body.empty()) {
        throw RailError(ErrorCode::ContractCallFailed, "Empty hex value");
    }

    // Little-endian base 1e9 limbs
    std::vector<uint32_t> limbs{0};
    for (char c : body) {
        int v = hex_value(c);
        if (v < 0) {
            throw RailError(ErrorCode::ContractCallFailed,
                            fmt::format("Invalid hex digit '{}'", c));
        }
        uint64_t carry = static_cast<uint64_t>(v);
        for (auto& limb : limbs) {
            uint64_t cur = static_cast<uint64_t>(limb) * 16 + carry;
            limb = static_cast<uint32_t>(cur % 1000000000ULL);
            carry = cur / 1000000000ULL;
        }
        while (carry > 0) {
            limbs.push_back(static_cast<uint32_t>(carry % 1000000000ULL));
            carry /= 1000000000ULL;
        }
    }

    std::string out = std::to_string(limbs.back());
    for (size_t i = limbs.size() - 1; i-- > 0;) {
        out += fmt::format("{:09d}", limbs[i]);
    }
    return out;
}

std::string decode_uint256(const std::string& data) {
    std::string body = strip_prefix(data);
    if (body.empty()) {
        throw RailError(ErrorCode::ContractCallFailed, "Contract returned no data");
    }
    return hex_to_decimal(body.size() > 64 ? word_at(body, 0) : body);
}

uint32_t decode_small_uint(const std::string& data, uint32_t max_value) {
    std::string decimal = decode_uint256(data);
    if (decimal.size() > 10 || std::stoull(decimal) > max_value) {
        throw RailError(ErrorCode::ContractCallFailed,
                        fmt::format("Value {} exceeds {}", decimal, max_value));
    }
    return static_cast<uint32_t>(std::stoul(decimal));
}

std::string decode_string(const std::string& data) {
    std::string body = strip_prefix(data);
    if (body.empty()) {
        throw RailError(ErrorCode::ContractCallFailed, "Contract returned no data");
    }

    if (body.size() == 64) {
        std::string raw = bytes_from_hex(body);
        raw.erase(std::find(raw.begin(), raw.end(), '\0'), raw.end());
        return raw;
    }

    uint64_t offset = word_to_offset(word_at(body, 0));
    if (offset % 32 != 0) {
        throw RailError(ErrorCode::ContractCallFailed, "Misaligned ABI string offset");
    }
    size_t len_word = static_cast<size_t>(offset / 32);
    uint64_t length = word_to_offset(word_at(body, len_word));
    size_t start = (len_word + 1) * 64;
    if (body.size() < start + length * 2) {
        throw RailError(ErrorCode::ContractCallFailed, "ABI string exceeds returned data");
    }
    return bytes_from_hex(body.substr(start, static_cast<size_t>(length * 2)));
}

std::string format_units(const std::string& decimal, uint32_t decimals) {
    std::string digits = decimal;
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));

    if (decimals == 0) {
        return digits;
    }
    if (digits.size() <= decimals) {
        digits = std::string(decimals - digits.size() + 1, '0') + digits;
    }
    size_t point = digits.size() - decimals;
    return digits.substr(0, point) + "." + digits.substr(point);
}

std::string trim_fraction(const std::string& formatted) {
    auto point = formatted.find('.');
    if (point == std::string::npos) {
        return formatted;
    }
    auto last = formatted.find_last_not_of('0');
    if (last == point) {
        return formatted.substr(0, point);
    }
    return formatted.substr(0, last + 1);
}

} // namespace abi
