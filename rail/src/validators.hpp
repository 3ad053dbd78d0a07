#pragma once

#include <string>
#include <cstdint>

namespace validators {

// Throw RailError(InvalidInput) before any network call is made
uint64_t validate_chain_id(int64_t chain_id);
std::string validate_endpoint_url(const std::string& url);
std::string validate_address(const std::string& address, const std::string& param_name = "address");

// http(s)://host[:port][/path], no whitespace, no unresolved ${...} placeholder
bool is_valid_endpoint_url(const std::string& url, std::string* reason = nullptr);

bool is_valid_address(const std::string& address);

// EIP-55 mixed-case checksum encoding
std::string to_checksum_address(const std::string& address);

} // namespace validators
