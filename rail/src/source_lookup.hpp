#pragma once

#include "api_key_store.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct SourceCode {
    std::string origin;   // "sourcify" or "etherscan"
    std::vector<std::pair<std::string, std::string>> files;   // path, content
};

// Sourcify first; Etherscan v2 with a stored key as the fallback
class SourceLookup {
public:
    SourceLookup(std::shared_ptr<HttpClient> http,
                 std::string sourcify_url,
                 std::string etherscan_url,
                 std::shared_ptr<ApiKeyStore> keys,
                 std::string fallback_api_key,
                 int timeout_ms);

    SourceCode get_source_code(int64_t chain_id, const std::string& address);

private:
    std::shared_ptr<HttpClient> http_;
    std::string sourcify_url_;
    std::string etherscan_url_;
    std::shared_ptr<ApiKeyStore> keys_;
    std::string fallback_api_key_;
    int timeout_ms_;

    bool try_sourcify(uint64_t chain_id, const std::string& address, SourceCode& out);
    bool try_etherscan(uint64_t chain_id, const std::string& address, SourceCode& out);
};
