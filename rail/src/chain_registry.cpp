#include "chain_registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstdio>
#include <fstream>

ChainRegistryCache::ChainRegistryCache(std::shared_ptr<HttpClient> http,
                                       std::string source_url,
                                       int fetch_timeout_ms,
                                       int cache_duration_s,
                                       std::string cache_file,
                                       Clock clock)
    : http_(std::move(http))
    , source_url_(std::move(source_url))
    , fetch_timeout_ms_(fetch_timeout_ms)
    , cache_duration_s_(cache_duration_s)
    , cache_file_(std::move(cache_file))
    , clock_(clock ? std::move(clock) : Clock(util::current_unix_seconds))
    , fetched_at_(0)
    , fetch_count_(0)
    , disk_checked_(false)
{}

ChainRecords ChainRegistryCache::parse_records(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        throw RailError(ErrorCode::RegistryUnavailable, "Chain registry payload is not an array");
    }

    ChainRecords records;
    records.reserve(doc.size());
    for (const auto& entry : doc) {
        if (!entry.is_object() || !entry.contains("chainId") || !entry["chainId"].is_number_unsigned()) {
            continue;
        }

        ChainRecord record;
        record.chain_id = entry["chainId"].get<uint64_t>();
        record.name = entry.value("name", std::string());

        if (entry.contains("rpc") && entry["rpc"].is_array()) {
            for (const auto& rpc : entry["rpc"]) {
                if (rpc.is_string()) {
                    record.rpc.push_back(rpc.get<std::string>());
                } else if (rpc.is_object() && rpc.contains("url") && rpc["url"].is_string()) {
                    record.rpc.push_back(rpc["url"].get<std::string>());
                }
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::shared_ptr<const ChainRecords> ChainRegistryCache::fresh_locked(int64_t now) const {
    if (payload_ && now - fetched_at_ < cache_duration_s_) {
        return payload_;
    }
    return nullptr;
}

bool ChainRegistryCache::load_from_disk(int64_t now) {
    std::ifstream in(cache_file_);
    if (!in) {
        return false;
    }

    try {
        auto doc = nlohmann::json::parse(in);
        auto timestamp = static_cast<int64_t>(doc.value("timestamp", 0.0));
        if (now - timestamp >= cache_duration_s_ || !doc.contains("data")) {
            return false;
        }
        auto records = std::make_shared<const ChainRecords>(parse_records(doc["data"]));

        std::lock_guard<std::mutex> lock(state_mutex_);
        payload_ = std::move(records);
        fetched_at_ = timestamp;
        spdlog::info("Chain registry loaded from cache file {} ({} chains)",
                     cache_file_, payload_->size());
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring unreadable chain cache {}: {}", cache_file_, e.what());
        return false;
    }
}

bool ChainRegistryCache::persist(const nlohmann::json& raw, int64_t fetched_at) const {
    std::string tmp_path = cache_file_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return false;
        }
        out << nlohmann::json{{"timestamp", fetched_at}, {"data", raw}}.dump();
        if (!out.good()) {
            return false;
        }
    }
    return std::rename(tmp_path.c_str(), cache_file_.c_str()) == 0;
}

std::shared_ptr<const ChainRecords> ChainRegistryCache::get() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (auto fresh = fresh_locked(clock_())) {
            return fresh;
        }
    }

    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    // Another caller may have refreshed while we waited
    int64_t now = clock_();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (auto fresh = fresh_locked(now)) {
            return fresh;
        }
    }

    bool try_disk = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        try_disk = !disk_checked_;
        disk_checked_ = true;
    }
    if (try_disk && !cache_file_.empty() && load_from_disk(now)) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return payload_;
    }

    spdlog::info("Fetching chain registry from {}", source_url_);
    auto response = http_->get(source_url_, fetch_timeout_ms_);
    if (!response.ok()) {
        std::string reason = response.error.empty()
            ? fmt::format("HTTP {}", response.status) : response.error;
        throw RailError(ErrorCode::RegistryUnavailable,
                        fmt::format("Error fetching chain registry: {}", reason));
    }

    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw RailError(ErrorCode::RegistryUnavailable,
                        fmt::format("Chain registry returned malformed JSON: {}", e.what()));
    }

    auto records = std::make_shared<const ChainRecords>(parse_records(raw));

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        payload_ = records;
        fetched_at_ = now;
        fetch_count_++;
    }

    spdlog::info("Chain registry refreshed: {} chains", records->size());

    if (!cache_file_.empty() && !persist(raw, now)) {
        spdlog::warn("Could not write chain cache file {}", cache_file_);
    }

    return records;
}

void ChainRegistryCache::invalidate() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    payload_.reset();
    fetched_at_ = 0;
}

size_t ChainRegistryCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return fetch_count_;
}
