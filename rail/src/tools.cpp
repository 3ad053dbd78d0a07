#include "tools.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

ToolService::ToolService(std::shared_ptr<EndpointPool> pool,
                         std::shared_ptr<FailoverSelector> selector,
                         std::shared_ptr<DiscoveryProber> prober,
                         std::shared_ptr<ChainReader> reader,
                         std::shared_ptr<SourceLookup> sources,
                         std::shared_ptr<ApiKeyStore> keys)
    : pool_(std::move(pool))
    , selector_(std::move(selector))
    , prober_(std::move(prober))
    , reader_(std::move(reader))
    , sources_(std::move(sources))
    , keys_(std::move(keys))
{}

template <typename Fn>
ToolReply ToolService::guarded(const char* tool, Fn&& fn) {
    try {
        return ToolReply{true, fn()};
    } catch (const RailError& e) {
        spdlog::warn("{} failed [{}]: {}", tool, error_code_name(e.code()), e.what());
        std::string message = fmt::format("Error: {}", e.what());
        if (!e.hint().empty()) {
            message += fmt::format(" ({})", e.hint());
        }
        return ToolReply{false, message};
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", tool, e.what());
        return ToolReply{false, fmt::format("Error: {}", e.what())};
    }
}

ToolReply ToolService::set_rpc(int64_t chain_id, const std::string& rpc_url) {
    return guarded("set_rpc", [&]() {
        pool_->set_primary(chain_id, rpc_url);
        return fmt::format("Success: RPC URL for chain ID {} set to {}", chain_id, util::mask_url(rpc_url));
    });
}

ToolReply ToolService::set_backup_rpc(int64_t chain_id, const std::string& rpc_url) {
    return guarded("set_backup_rpc", [&]() {
        pool_->add_backup(chain_id, rpc_url);
        auto endpoints = pool_->get(static_cast<uint64_t>(chain_id));
        return fmt::format("Success: Backup RPC added for chain ID {} ({} of {} slots used)",
                           chain_id, endpoints.size(), pool_->max_size());
    });
}

ToolReply ToolService::rotate_rpc(int64_t chain_id) {
    return guarded("rotate_rpc", [&]() {
        auto endpoints = pool_->rotate(chain_id);
        return fmt::format("Success: Rotated RPCs for chain ID {}. New primary: {}",
                           chain_id, util::mask_url(endpoints.front()));
    });
}

ToolReply ToolService::delete_rpc(int64_t chain_id) {
    return guarded("delete_rpc", [&]() {
        pool_->remove(chain_id);
        return fmt::format("Success: Deleted RPC configuration for chain ID {}", chain_id);
    });
}

ToolReply ToolService::list_configs() {
    return guarded("list_configs", [&]() {
        std::string out = "=== RPC Configuration ===\n";
        auto pools = pool_->list();
        if (pools.empty()) {
            out += "No RPCs configured\n";
        }
        for (const auto& [chain_id, endpoints] : pools) {
            out += fmt::format("Chain {}:\n", chain_id);
            for (size_t i = 0; i < endpoints.size(); i++) {
                std::string label = i == 0 ? "Primary" : fmt::format("Backup {}", i);
                out += fmt::format("  {}: {}\n", label, util::mask_url(endpoints[i]));
            }
        }

        out += "\n=== API Keys ===\n";
        auto masked = keys_->masked();
        if (masked.empty()) {
            out += "No API keys configured\n";
        }
        for (const auto& [provider, secret] : masked) {
            out += fmt::format("{}: {}\n", provider, secret);
        }
        if (keys_->encryption_enabled()) {
            out += "(stored encrypted)\n";
        }
        return out;
    });
}

ToolReply ToolService::check_rpc_health(int64_t chain_id) {
    return guarded("check_rpc_health", [&]() {
        auto report = selector_->check_pool_health(chain_id);
        std::string out = fmt::format("=== RPC Health for Chain {} ===\n", chain_id);
        for (const auto& entry : report) {
            std::string label = entry.position == 0 ? "Primary" : fmt::format("Backup {}", entry.position);
            if (entry.health.healthy) {
                out += fmt::format("{}: {} - ✓ Healthy ({} ms)\n",
                                   label, util::mask_url(entry.endpoint), entry.health.latency_ms);
            } else {
                out += fmt::format("{}: {} - ✗ Unhealthy ({})\n",
                                   label, util::mask_url(entry.endpoint), entry.health.error);
            }
        }
        return out;
    });
}

ToolReply ToolService::query_rpc_urls(int64_t chain_id) {
    return guarded("query_rpc_urls", [&]() {
        auto result = prober_->discover(chain_id);
        return util::join(result.healthy, "\n");
    });
}

ToolReply ToolService::check_native_balance(int64_t chain_id, const std::string& address) {
    return guarded("check_native_balance", [&]() {
        auto balance = reader_->native_balance(chain_id, address);
        return fmt::format("{} ETH", balance.ether);
    });
}

ToolReply ToolService::get_token_balance(int64_t chain_id, const std::string& token, const std::string& wallet) {
    return guarded("get_token_balance", [&]() {
        auto balance = reader_->token_balance(chain_id, token, wallet);
        return fmt::format("Balance: {} (raw: {}, decimals: {})",
                           balance.formatted, balance.raw, balance.decimals);
    });
}

ToolReply ToolService::get_token_info(int64_t chain_id, const std::string& token) {
    return guarded("get_token_info", [&]() {
        auto info = reader_->token_info(chain_id, token);
        return fmt::format("Token Information:\n"
                           "Address: {}\n"
                           "Name: {}\n"
                           "Symbol: {}\n"
                           "Decimals: {}\n"
                           "Total Supply: {}",
                           info.address, info.name, info.symbol, info.decimals, info.total_supply);
    });
}

ToolReply ToolService::get_source_code(int64_t chain_id, const std::string& address) {
    return guarded("get_source_code", [&]() {
        auto source = sources_->get_source_code(chain_id, address);
        std::string out = fmt::format("Source: {} ({} files)\n", source.origin, source.files.size());
        for (const auto& [path, content] : source.files) {
            out += fmt::format("\n// File: {}\n{}\n", path, content);
        }
        return out;
    });
}

ToolReply ToolService::set_api_key(const std::string& provider, const std::string& key) {
    return guarded("set_api_key", [&]() {
        keys_->set(provider, key);
        return fmt::format("Success: API key for {} set", util::to_lower(util::trim(provider)));
    });
}

ToolReply ToolService::delete_api_key(const std::string& provider) {
    return guarded("delete_api_key", [&]() {
        keys_->remove(provider);
        return fmt::format("Success: API key for {} deleted", util::to_lower(util::trim(provider)));
    });
}

const std::vector<std::string>& ToolService::tool_names() {
    static const std::vector<std::string> names = {
        "set_rpc", "set_backup_rpc", "rotate_rpc", "delete_rpc", "list_configs",
        "check_rpc_health", "query_rpc_urls", "check_native_balance",
        "get_token_balance", "get_token_info", "get_source_code",
        "set_api_key", "delete_api_key"
    };
    return names;
}

nlohmann::json ToolService::dispatch(const std::string& tool, const nlohmann::json& args) {
    ToolReply reply{false, ""};

    try {
        auto chain = [&]() { return args.at("chain_id").get<int64_t>(); };
        auto str = [&](const char* key) { return args.at(key).get<std::string>(); };

        if (tool == "set_rpc") {
            reply = set_rpc(chain(), str("rpc_url"));
        } else if (tool == "set_backup_rpc") {
            reply = set_backup_rpc(chain(), str("rpc_url"));
        } else if (tool == "rotate_rpc") {
            reply = rotate_rpc(chain());
        } else if (tool == "delete_rpc") {
            reply = delete_rpc(chain());
        } else if (tool == "list_configs") {
            reply = list_configs();
        } else if (tool == "check_rpc_health") {
            reply = check_rpc_health(chain());
        } else if (tool == "query_rpc_urls") {
            reply = query_rpc_urls(chain());
        } else if (tool == "check_native_balance") {
            reply = check_native_balance(chain(), str("address"));
        } else if (tool == "get_token_balance") {
            reply = get_token_balance(chain(), str("token_address"), str("wallet_address"));
        } else if (tool == "get_token_info") {
            reply = get_token_info(chain(), str("token_address"));
        } else if (tool == "get_source_code") {
            reply = get_source_code(chain(), str("address"));
        } else if (tool == "set_api_key") {
            reply = set_api_key(str("provider"), str("key"));
        } else if (tool == "delete_api_key") {
            reply = delete_api_key(str("provider"));
        } else {
            reply = ToolReply{false, fmt::format("Error: Unknown tool '{}'", tool)};
        }
    } catch (const nlohmann::json::exception& e) {
        reply = ToolReply{false, fmt::format("Error: Invalid arguments for {}: {}", tool, e.what())};
    }

    return nlohmann::json{
        {"ok", reply.ok},
        {"message", reply.message},
        {"ts", util::current_iso8601()}
    };
}
