#pragma once

#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <cstdint>

// JSON-RPC 2.0 client bound to a single endpoint. Every failure (transport,
// HTTP status, malformed body, RPC error object) throws RailError(RpcFailed).
class EvmRpcClient {
public:
    EvmRpcClient(std::shared_ptr<HttpClient> http, std::string url, int timeout_ms);

    std::string client_version();
    uint64_t chain_id();
    std::string get_balance(const std::string& address, const std::string& block = "latest");
    std::string call(const std::string& to, const std::string& data, const std::string& block = "latest");

    static uint64_t parse_quantity(const std::string& hex);

private:
    std::shared_ptr<HttpClient> http_;
    std::string url_;
    int timeout_ms_;
    uint64_t next_id_;

    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);
};
