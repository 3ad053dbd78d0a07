#include "config.hpp"
#include "config_store.hpp"
#include "http_client.hpp"
#include "health_checker.hpp"
#include "endpoint_pool.hpp"
#include "failover_selector.hpp"
#include "chain_registry.hpp"
#include "discovery_prober.hpp"
#include "chain_reader.hpp"
#include "api_key_store.hpp"
#include "source_lookup.hpp"
#include "tools.hpp"
#include "tool_server.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }
    auto logger = std::make_shared<spdlog::logger>(service_name, sinks.begin(), sinks.end());

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level, config->log_file);

        spdlog::info("==============================================");
        spdlog::info("ChainRail RPC Manager v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto http = std::make_shared<CurlHttpClient>();
        auto checker = std::make_shared<HealthChecker>(http);
        auto store = std::make_shared<ConfigStore>(config->config_path);
        auto pool = std::make_shared<EndpointPool>(checker, store, config->max_pool_size(),
                                                   config->health_check_timeout_s * 1000);
        auto selector = std::make_shared<FailoverSelector>(pool, checker, config->rpc_timeout_s * 1000);
        auto registry = std::make_shared<ChainRegistryCache>(http, config->chain_list_url,
                                                             config->registry_timeout_s * 1000,
                                                             config->cache_duration_s,
                                                             config->cache_file);
        auto prober = std::make_shared<DiscoveryProber>(registry, checker,
                                                        static_cast<size_t>(config->max_candidates),
                                                        static_cast<size_t>(config->discovery_workers),
                                                        config->discovery_timeout_s * 1000);
        auto reader = std::make_shared<ChainReader>(selector, http, config->rpc_timeout_s * 1000);
        auto keys = std::make_shared<ApiKeyStore>(store);
        auto sources = std::make_shared<SourceLookup>(http, config->sourcify_url, config->etherscan_url,
                                                      keys, config->etherscan_api_key,
                                                      config->registry_timeout_s * 1000);

        // Restore persisted state
        auto stored = store->load();
        pool->load(stored.pools);
        keys->load(stored.api_keys, stored.encryption);
        if (!config->encryption_password.empty()) {
            keys->enable_encryption(config->encryption_password);
        } else if (stored.encryption.enabled) {
            spdlog::warn("Stored API keys are encrypted but RAIL_ENCRYPTION_KEY is not set");
        }
        spdlog::info("Loaded {} chain pools and {} API keys from {}",
                     stored.pools.size(), stored.api_keys.size(), store->path());

        auto tools = std::make_shared<ToolService>(pool, selector, prober, reader, sources, keys);
        ToolServer server(*config, tools, pool, keys);
        server.start();

        spdlog::info("ChainRail service started");

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        server.stop();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
