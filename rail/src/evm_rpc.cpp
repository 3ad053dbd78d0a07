#include "evm_rpc.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

EvmRpcClient::EvmRpcClient(std::shared_ptr<HttpClient> http, std::string url, int timeout_ms)
    : http_(std::move(http))
    , url_(std::move(url))
    , timeout_ms_(timeout_ms)
    , next_id_(1)
{}

nlohmann::json EvmRpcClient::make_request(const std::string& method, const nlohmann::json& params) {
    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    auto response = http_->post_json(url_, payload.dump(), timeout_ms_);

    if (!response.error.empty()) {
        throw RailError(ErrorCode::RpcFailed,
                        fmt::format("{} failed: {}", method, response.error));
    }
    if (!response.ok()) {
        throw RailError(ErrorCode::RpcFailed,
                        fmt::format("{} failed: HTTP {}", method, response.status));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw RailError(ErrorCode::RpcFailed,
                        fmt::format("{} returned malformed JSON: {}", method, e.what()));
    }

    if (body.contains("error") && !body["error"].is_null()) {
        const auto& err = body["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw RailError(ErrorCode::RpcFailed, fmt::format("{} error: {}", method, message));
    }
    if (!body.contains("result")) {
        throw RailError(ErrorCode::RpcFailed, fmt::format("{} returned no result", method));
    }

    return body["result"];
}

uint64_t EvmRpcClient::parse_quantity(const std::string& hex) {
    if (hex.size() < 3 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X') || hex.size() > 18) {
        throw RailError(ErrorCode::RpcFailed, fmt::format("Invalid hex quantity '{}'", hex));
    }
    try {
        size_t pos = 0;
        uint64_t value = std::stoull(hex.substr(2), &pos, 16);
        if (pos != hex.size() - 2) {
            throw RailError(ErrorCode::RpcFailed, fmt::format("Invalid hex quantity '{}'", hex));
        }
        return value;
    } catch (const std::logic_error&) {
        throw RailError(ErrorCode::RpcFailed, fmt::format("Invalid hex quantity '{}'", hex));
    }
}

std::string EvmRpcClient::client_version() {
    auto result = make_request("web3_clientVersion", nlohmann::json::array());
    return result.is_string() ? result.get<std::string>() : result.dump();
}

uint64_t EvmRpcClient::chain_id() {
    auto result = make_request("eth_chainId", nlohmann::json::array());
    if (!result.is_string()) {
        throw RailError(ErrorCode::RpcFailed, "eth_chainId returned a non-string result");
    }
    return parse_quantity(result.get<std::string>());
}

std::string EvmRpcClient::get_balance(const std::string& address, const std::string& block) {
    auto result = make_request("eth_getBalance", nlohmann::json::array({address, block}));
    if (!result.is_string()) {
        throw RailError(ErrorCode::RpcFailed, "eth_getBalance returned a non-string result");
    }
    return result.get<std::string>();
}

std::string EvmRpcClient::call(const std::string& to, const std::string& data, const std::string& block) {
    nlohmann::json tx = {{"to", to}, {"data", data}};
    auto result = make_request("eth_call", nlohmann::json::array({tx, block}));
    if (!result.is_string()) {
        throw RailError(ErrorCode::RpcFailed, "eth_call returned a non-string result");
    }
    spdlog::debug("eth_call {} on {}", data.substr(0, 10), util::mask_url(url_));
    return result.get<std::string>();
}
