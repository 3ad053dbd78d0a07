#pragma once

#include <string>
#include <cstdlib>
#include <cstddef>

struct Config {
    // Timeouts are converted to milliseconds as int
    static constexpr int MAX_TIMEOUT_S = 600;

    // Endpoint pool. Probe timeouts run short < medium < long
    int max_backups;
    int rpc_timeout_s;            // short: failover probes
    int discovery_timeout_s;      // medium: discovery probes
    int health_check_timeout_s;   // long: set_rpc / set_backup_rpc probes

    // Chain registry
    std::string chain_list_url;
    int registry_timeout_s;
    int cache_duration_s;
    std::string cache_file;

    // Discovery
    int max_candidates;
    int discovery_workers;

    // Source lookup
    std::string sourcify_url;
    std::string etherscan_url;
    std::string etherscan_api_key;

    // Persistence
    std::string config_path;
    std::string encryption_password;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;
    std::string log_file;

    size_t max_pool_size() const { return static_cast<size_t>(max_backups) + 1; }

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
