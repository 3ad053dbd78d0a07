#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string text(val);
    size_t consumed = 0;
    int parsed = default_val;
    try {
        parsed = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    // Trailing junk such as "5abc" is rejected, not truncated
    if (consumed == 0 || consumed != text.size()) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
    return parsed;
}

Config Config::from_env() {
    Config cfg;

    cfg.max_backups = get_env_int("RAIL_MAX_BACKUPS", 2);
    cfg.rpc_timeout_s = get_env_int("RAIL_RPC_TIMEOUT", 3);
    cfg.discovery_timeout_s = get_env_int("RAIL_DISCOVERY_TIMEOUT", 5);
    cfg.health_check_timeout_s = get_env_int("RAIL_HEALTH_CHECK_TIMEOUT", 10);

    cfg.chain_list_url = get_env("RAIL_CHAIN_LIST_URL", "https://chainid.network/chains.json");
    cfg.registry_timeout_s = get_env_int("RAIL_REGISTRY_TIMEOUT", 10);
    cfg.cache_duration_s = get_env_int("RAIL_CACHE_DURATION", 3600);
    cfg.cache_file = get_env("RAIL_CACHE_FILE", "chain_cache.json");

    cfg.max_candidates = get_env_int("RAIL_MAX_CANDIDATES", 10);
    cfg.discovery_workers = get_env_int("RAIL_DISCOVERY_WORKERS", 5);

    cfg.sourcify_url = get_env("RAIL_SOURCIFY_URL", "https://sourcify.dev/server");
    cfg.etherscan_url = get_env("RAIL_ETHERSCAN_URL", "https://api.etherscan.io/v2/api");
    cfg.etherscan_api_key = get_env("ETHERSCAN_API_KEY");

    cfg.config_path = get_env("RAIL_CONFIG_PATH", "rail_config.json");
    cfg.encryption_password = get_env("RAIL_ENCRYPTION_KEY");

    cfg.listen_addr = get_env("LISTEN_ADDR", "127.0.0.1");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "chainrail");
    cfg.log_level = util::to_lower(get_env("LOG_LEVEL", "info"));
    cfg.log_file = get_env("RAIL_LOG_FILE");

    return cfg;
}

void Config::validate() const {
    if (max_backups < 0) {
        throw std::runtime_error("RAIL_MAX_BACKUPS must be >= 0");
    }
    if (rpc_timeout_s <= 0 || health_check_timeout_s <= 0 || discovery_timeout_s <= 0) {
        throw std::runtime_error("RPC timeouts must be positive");
    }
    if (registry_timeout_s <= 0 || cache_duration_s <= 0) {
        throw std::runtime_error("RAIL_REGISTRY_TIMEOUT and RAIL_CACHE_DURATION must be positive");
    }
    if (rpc_timeout_s > MAX_TIMEOUT_S || health_check_timeout_s > MAX_TIMEOUT_S ||
        discovery_timeout_s > MAX_TIMEOUT_S || registry_timeout_s > MAX_TIMEOUT_S) {
        throw std::runtime_error(fmt::format("Timeouts must not exceed {}s", MAX_TIMEOUT_S));
    }
    if (max_candidates <= 0 || discovery_workers <= 0) {
        throw std::runtime_error("RAIL_MAX_CANDIDATES and RAIL_DISCOVERY_WORKERS must be positive");
    }
    if (chain_list_url.empty() || sourcify_url.empty() || etherscan_url.empty()) {
        throw std::runtime_error("Registry and verification service URLs are required");
    }
    if (config_path.empty()) {
        throw std::runtime_error("RAIL_CONFIG_PATH is required");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Pool size: primary + {} backups", max_backups);
    spdlog::info("  Timeouts: failover={}s, health={}s, discovery={}s",
                 rpc_timeout_s, health_check_timeout_s, discovery_timeout_s);
    spdlog::info("  Discovery: {} candidates, {} workers, cache {}s",
                 max_candidates, discovery_workers, cache_duration_s);
    spdlog::info("  Key encryption: {}", encryption_password.empty() ? "disabled" : "enabled");
}
