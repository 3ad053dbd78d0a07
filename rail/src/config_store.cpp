#include "config_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path))
{}

nlohmann::json ConfigStore::to_json(const StoredConfig& config) {
    nlohmann::json rpcs = nlohmann::json::object();
    for (const auto& [chain_id, endpoints] : config.pools) {
        rpcs[std::to_string(chain_id)] = endpoints;
    }

    nlohmann::json keys = nlohmann::json::object();
    for (const auto& [provider, secret] : config.api_keys) {
        keys[provider] = secret;
    }

    nlohmann::json doc = {
        {"rpcs", rpcs},
        {"api_keys", keys}
    };
    if (config.encryption.enabled) {
        doc["encryption"] = {
            {"enabled", true},
            {"salt", config.encryption.salt}
        };
    }
    return doc;
}

StoredConfig ConfigStore::from_json(const nlohmann::json& doc) {
    StoredConfig config;
    if (!doc.is_object()) {
        spdlog::warn("Config document is not an object, ignoring");
        return config;
    }

    if (doc.contains("rpcs") && doc["rpcs"].is_object()) {
        for (const auto& [key, value] : doc["rpcs"].items()) {
            uint64_t chain_id = 0;
            try {
                size_t pos = 0;
                long long parsed = std::stoll(key, &pos);
                if (pos != key.size() || parsed <= 0) {
                    throw std::invalid_argument(key);
                }
                chain_id = static_cast<uint64_t>(parsed);
            } catch (const std::logic_error&) {
                spdlog::warn("Skipping invalid chain id '{}' in config", key);
                continue;
            }

            std::vector<std::string> endpoints;
            if (value.is_string()) {
                // Legacy single-endpoint format
                endpoints.push_back(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto& entry : value) {
                    if (!entry.is_string()) {
                        spdlog::warn("Skipping non-string RPC entry for chain {}", chain_id);
                        continue;
                    }
                    endpoints.push_back(entry.get<std::string>());
                }
            } else {
                spdlog::warn("Skipping malformed RPC list for chain {}", chain_id);
                continue;
            }

            if (!endpoints.empty()) {
                config.pools[chain_id] = std::move(endpoints);
            }
        }
    }

    if (doc.contains("api_keys") && doc["api_keys"].is_object()) {
        for (const auto& [provider, secret] : doc["api_keys"].items()) {
            if (secret.is_string()) {
                config.api_keys[util::to_lower(provider)] = secret.get<std::string>();
            }
        }
    }

    if (doc.contains("encryption") && doc["encryption"].is_object()) {
        const auto& enc = doc["encryption"];
        config.encryption.enabled = enc.value("enabled", false);
        config.encryption.salt = enc.value("salt", std::string());
    }

    return config;
}

StoredConfig ConfigStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_);
    if (!in) {
        spdlog::info("Config file {} not found, starting empty", path_);
        current_ = StoredConfig{};
        return current_;
    }

    try {
        nlohmann::json doc = nlohmann::json::parse(in);
        current_ = from_json(doc);
        spdlog::info("Loaded {} RPC pools and {} API keys from {}",
                     current_.pools.size(), current_.api_keys.size(), path_);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse config file {}: {}", path_, e.what());
        current_ = StoredConfig{};
    }

    return current_;
}

bool ConfigStore::write_locked() {
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open {} for writing", tmp_path);
            return false;
        }
        out << to_json(current_).dump(2);
        if (!out.good()) {
            spdlog::error("Failed to write {}", tmp_path);
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        spdlog::error("Failed to replace config file {}", path_);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

bool ConfigStore::save(const StoredConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = config;
    return write_locked();
}

bool ConfigStore::save_pools(const PoolMap& pools) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.pools = pools;
    return write_locked();
}

bool ConfigStore::save_api_keys(const ApiKeyMap& keys, const EncryptionState& encryption) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.api_keys = keys;
    current_.encryption = encryption;
    return write_locked();
}
