#pragma once

#include "api_key_store.hpp"
#include "chain_reader.hpp"
#include "discovery_prober.hpp"
#include "endpoint_pool.hpp"
#include "failover_selector.hpp"
#include "source_lookup.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

struct ToolReply {
    bool ok;
    std::string message;
};

// User-facing operations. Typed failures from the layers below are turned
// into "Error: ..." replies here and nowhere else.
class ToolService {
public:
    ToolService(std::shared_ptr<EndpointPool> pool,
                std::shared_ptr<FailoverSelector> selector,
                std::shared_ptr<DiscoveryProber> prober,
                std::shared_ptr<ChainReader> reader,
                std::shared_ptr<SourceLookup> sources,
                std::shared_ptr<ApiKeyStore> keys);

    ToolReply set_rpc(int64_t chain_id, const std::string& rpc_url);
    ToolReply set_backup_rpc(int64_t chain_id, const std::string& rpc_url);
    ToolReply rotate_rpc(int64_t chain_id);
    ToolReply delete_rpc(int64_t chain_id);
    ToolReply list_configs();
    ToolReply check_rpc_health(int64_t chain_id);
    ToolReply query_rpc_urls(int64_t chain_id);

    ToolReply check_native_balance(int64_t chain_id, const std::string& address);
    ToolReply get_token_balance(int64_t chain_id, const std::string& token, const std::string& wallet);
    ToolReply get_token_info(int64_t chain_id, const std::string& token);
    ToolReply get_source_code(int64_t chain_id, const std::string& address);

    ToolReply set_api_key(const std::string& provider, const std::string& key);
    ToolReply delete_api_key(const std::string& provider);

    // {"ok": bool, "message": str, "ts": iso8601}
    nlohmann::json dispatch(const std::string& tool, const nlohmann::json& args);

    static const std::vector<std::string>& tool_names();

private:
    std::shared_ptr<EndpointPool> pool_;
    std::shared_ptr<FailoverSelector> selector_;
    std::shared_ptr<DiscoveryProber> prober_;
    std::shared_ptr<ChainReader> reader_;
    std::shared_ptr<SourceLookup> sources_;
    std::shared_ptr<ApiKeyStore> keys_;

    template <typename Fn>
    ToolReply guarded(const char* tool, Fn&& fn);
};
