#include "chain_reader.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "evm_rpc.hpp"
#include "util.hpp"
#include "validators.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
constexpr uint32_t MAX_DECIMALS = 255;
}

ChainReader::ChainReader(std::shared_ptr<FailoverSelector> selector,
                         std::shared_ptr<HttpClient> http,
                         int timeout_ms)
    : selector_(std::move(selector))
    , http_(std::move(http))
    , timeout_ms_(timeout_ms)
{}

std::string ChainReader::erc20_call(EvmRpcClient& rpc, const std::string& token,
                                    const std::string& data, const char* what) {
    try {
        std::string result = rpc.call(token, data);
        if (result.size() <= 2) {
            throw RailError(ErrorCode::ContractCallFailed,
                            fmt::format("{}() returned no data; {} may not be an ERC-20 contract",
                                        what, util::mask_address(token)));
        }
        return result;
    } catch (const RailError& e) {
        if (e.code() == ErrorCode::ContractCallFailed) throw;
        throw RailError(ErrorCode::ContractCallFailed,
                        fmt::format("{}() call failed on {}: {}", what, util::mask_address(token), e.what()));
    }
}

NativeBalance ChainReader::native_balance(int64_t chain_id, const std::string& address) {
    std::string checksummed = validators::validate_address(address);
    std::string endpoint = selector_->resolve(chain_id);

    EvmRpcClient rpc(http_, endpoint, timeout_ms_);
    std::string wei_hex = rpc.get_balance(checksummed);

    NativeBalance balance;
    balance.address = checksummed;
    balance.wei = abi::hex_to_decimal(wei_hex);
    balance.ether = abi::trim_fraction(abi::format_units(balance.wei, 18));
    balance.endpoint = endpoint;
    return balance;
}

TokenBalance ChainReader::token_balance(int64_t chain_id, const std::string& token, const std::string& holder) {
    std::string token_addr = validators::validate_address(token, "token address");
    std::string holder_addr = validators::validate_address(holder, "wallet address");
    std::string endpoint = selector_->resolve(chain_id);

    EvmRpcClient rpc(http_, endpoint, timeout_ms_);

    TokenBalance balance;
    balance.token = token_addr;
    balance.holder = holder_addr;
    balance.raw = abi::decode_uint256(
        erc20_call(rpc, token_addr, abi::encode_address_call(abi::SELECTOR_BALANCE_OF, holder_addr), "balanceOf"));
    balance.decimals = abi::decode_small_uint(
        erc20_call(rpc, token_addr, abi::encode_call(abi::SELECTOR_DECIMALS), "decimals"), MAX_DECIMALS);
    balance.formatted = abi::format_units(balance.raw, balance.decimals);

    spdlog::debug("Token balance {} of {} on chain {}: {}",
                  util::mask_address(token_addr), util::mask_address(holder_addr), chain_id, balance.formatted);
    return balance;
}

TokenInfo ChainReader::token_info(int64_t chain_id, const std::string& token) {
    std::string token_addr = validators::validate_address(token, "token address");
    std::string endpoint = selector_->resolve(chain_id);

    EvmRpcClient rpc(http_, endpoint, timeout_ms_);

    TokenInfo info;
    info.address = token_addr;
    info.name = abi::decode_string(erc20_call(rpc, token_addr, abi::encode_call(abi::SELECTOR_NAME), "name"));
    info.symbol = abi::decode_string(erc20_call(rpc, token_addr, abi::encode_call(abi::SELECTOR_SYMBOL), "symbol"));
    info.decimals = abi::decode_small_uint(
        erc20_call(rpc, token_addr, abi::encode_call(abi::SELECTOR_DECIMALS), "decimals"), MAX_DECIMALS);
    info.total_supply_raw = abi::decode_uint256(
        erc20_call(rpc, token_addr, abi::encode_call(abi::SELECTOR_TOTAL_SUPPLY), "totalSupply"));
    info.total_supply = abi::format_units(info.total_supply_raw, info.decimals);
    return info;
}
