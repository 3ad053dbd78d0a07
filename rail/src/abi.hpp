#pragma once

#include <string>
#include <cstdint>

// Minimal ERC-20 ABI helpers. Values travel as 0x-prefixed hex strings the
// way eth_call returns them; uint256 values are rendered as exact decimals.
namespace abi {

constexpr const char* SELECTOR_NAME = "0x06fdde03";
constexpr const char* SELECTOR_SYMBOL = "0x95d89b41";
constexpr const char* SELECTOR_DECIMALS = "0x313ce567";
constexpr const char* SELECTOR_TOTAL_SUPPLY = "0x18160ddd";
constexpr const char* SELECTOR_BALANCE_OF = "0x70a08231";

std::string encode_call(const std::string& selector);
std::string encode_address_call(const std::string& selector, const std::string& address);

// Big-endian hex (with or without 0x) to base-10 string
std::string hex_to_decimal(const std::string& hex);

std::string decode_uint256(const std::string& data);
uint32_t decode_small_uint(const std::string& data, uint32_t max_value);

// Dynamic `string` returns, with a fallback for legacy bytes32 tokens
std::string decode_string(const std::string& data);

// "1500000", 6 -> "1.500000"
std::string format_units(const std::string& decimal, uint32_t decimals);
std::string trim_fraction(const std::string& formatted);

} // namespace abi
