#pragma once

#include "http_client.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ChainRecord {
    uint64_t chain_id;
    std::string name;
    std::vector<std::string> rpc;

    bool operator==(const ChainRecord& other) const {
        return chain_id == other.chain_id && name == other.name && rpc == other.rpc;
    }
};

using ChainRecords = std::vector<ChainRecord>;

// Time-bounded cache of the public chain registry. Expired entries are
// never served; a failed refresh throws RegistryUnavailable.
class ChainRegistryCache {
public:
    using Clock = std::function<int64_t()>;   // unix seconds

    ChainRegistryCache(std::shared_ptr<HttpClient> http,
                       std::string source_url,
                       int fetch_timeout_ms,
                       int cache_duration_s,
                       std::string cache_file,
                       Clock clock = nullptr);

    std::shared_ptr<const ChainRecords> get();

    void invalidate();
    size_t fetch_count() const;

    static ChainRecords parse_records(const nlohmann::json& doc);

private:
    std::shared_ptr<HttpClient> http_;
    std::string source_url_;
    int fetch_timeout_ms_;
    int cache_duration_s_;
    std::string cache_file_;
    Clock clock_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<const ChainRecords> payload_;
    int64_t fetched_at_;
    size_t fetch_count_;
    bool disk_checked_;

    // Held across the remote fetch so concurrent misses share one request
    std::mutex refresh_mutex_;

    std::shared_ptr<const ChainRecords> fresh_locked(int64_t now) const;
    bool load_from_disk(int64_t now);
    bool persist(const nlohmann::json& raw, int64_t fetched_at) const;
};
