#pragma once

#include "failover_selector.hpp"
#include "evm_rpc.hpp"
#include "http_client.hpp"
#include <cstdint>
#include <memory>
#include <string>

struct NativeBalance {
    std::string address;
    std::string wei;
    std::string ether;
    std::string endpoint;
};

struct TokenBalance {
    std::string token;
    std::string holder;
    std::string raw;
    uint32_t decimals;
    std::string formatted;
};

struct TokenInfo {
    std::string address;
    std::string name;
    std::string symbol;
    uint32_t decimals;
    std::string total_supply_raw;
    std::string total_supply;
};

// Read-only chain state through the failover path
class ChainReader {
public:
    ChainReader(std::shared_ptr<FailoverSelector> selector,
                std::shared_ptr<HttpClient> http,
                int timeout_ms);

    NativeBalance native_balance(int64_t chain_id, const std::string& address);
    TokenBalance token_balance(int64_t chain_id, const std::string& token, const std::string& holder);
    TokenInfo token_info(int64_t chain_id, const std::string& token);

private:
    std::shared_ptr<FailoverSelector> selector_;
    std::shared_ptr<HttpClient> http_;
    int timeout_ms_;

    std::string erc20_call(EvmRpcClient& rpc, const std::string& token,
                           const std::string& data, const char* what);
};
