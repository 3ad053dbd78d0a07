#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

using PoolMap = std::map<uint64_t, std::vector<std::string>>;
using ApiKeyMap = std::map<std::string, std::string>;

struct EncryptionState {
    bool enabled = false;
    std::string salt;   // base64
};

struct StoredConfig {
    PoolMap pools;
    ApiKeyMap api_keys;
    EncryptionState encryption;
};

// File-backed mirror of the endpoint pools and API keys. The in-memory
// stores stay authoritative; every write is best effort and reports
// failure through its return value.
class ConfigStore {
public:
    explicit ConfigStore(std::string path);

    StoredConfig load();
    bool save(const StoredConfig& config);
    bool save_pools(const PoolMap& pools);
    bool save_api_keys(const ApiKeyMap& keys, const EncryptionState& encryption);

    const std::string& path() const { return path_; }

    static nlohmann::json to_json(const StoredConfig& config);
    static StoredConfig from_json(const nlohmann::json& doc);

private:
    std::string path_;
    std::mutex mutex_;
    StoredConfig current_;

    bool write_locked();
};
