#include "endpoint_pool.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "validators.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

EndpointPool::EndpointPool(std::shared_ptr<HealthChecker> checker,
                           std::shared_ptr<ConfigStore> store,
                           size_t max_size,
                           int probe_timeout_ms)
    : checker_(std::move(checker))
    , store_(std::move(store))
    , max_size_(std::max<size_t>(max_size, 1))
    , probe_timeout_ms_(probe_timeout_ms)
{}

void EndpointPool::truncate(std::vector<std::string>& endpoints) const {
    if (endpoints.size() > max_size_) {
        endpoints.resize(max_size_);
    }
}

void EndpointPool::load(const PoolMap& pools) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_.clear();

    for (const auto& [chain_id, endpoints] : pools) {
        std::vector<std::string> unique;
        for (const auto& endpoint : endpoints) {
            if (std::find(unique.begin(), unique.end(), endpoint) == unique.end()) {
                unique.push_back(endpoint);
            }
        }
        truncate(unique);
        if (!unique.empty()) {
            pools_[chain_id] = std::move(unique);
        }
    }

    spdlog::info("Endpoint pool loaded for {} chains", pools_.size());
}

std::unique_lock<std::mutex> EndpointPool::lock_chain(uint64_t chain_id) {
    // Never hold two stripes at once: chains sharing a stripe would deadlock
    return std::unique_lock<std::mutex>(chain_locks_[chain_id % LOCK_STRIPES]);
}

void EndpointPool::require_healthy(uint64_t chain_id, const std::string& endpoint) const {
    auto health = checker_->check(endpoint, chain_id, probe_timeout_ms_);
    if (!health.healthy) {
        throw RailError(ErrorCode::EndpointUnreachable,
                        fmt::format("RPC URL {} is unreachable or belongs to a different chain ID "
                                    "(chain {}: {})",
                                    util::mask_url(endpoint), chain_id, health.error));
    }
}

void EndpointPool::set_primary(int64_t chain_id, const std::string& endpoint) {
    uint64_t chain = validators::validate_chain_id(chain_id);
    std::string url = validators::validate_endpoint_url(util::trim(endpoint));

    auto chain_lock = lock_chain(chain);
    require_healthy(chain, url);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& endpoints = pools_[chain];
        endpoints.erase(std::remove(endpoints.begin(), endpoints.end(), url), endpoints.end());
        endpoints.insert(endpoints.begin(), url);
        truncate(endpoints);
    }

    spdlog::info("Primary RPC for chain {} set to {}", chain, util::mask_url(url));
    flush();
}

void EndpointPool::add_backup(int64_t chain_id, const std::string& endpoint) {
    uint64_t chain = validators::validate_chain_id(chain_id);
    std::string url = validators::validate_endpoint_url(util::trim(endpoint));

    if (max_size_ < 2) {
        throw RailError(ErrorCode::InvalidInput,
                        "Backup RPCs are disabled", "Raise RAIL_MAX_BACKUPS above 0");
    }

    auto chain_lock = lock_chain(chain);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(chain);
        if (it == pools_.end() || it->second.empty()) {
            throw RailError(ErrorCode::NoConfiguration,
                            fmt::format("No primary RPC configured for chain {}", chain),
                            "Use set_rpc first");
        }
        const auto& endpoints = it->second;
        if (std::find(endpoints.begin(), endpoints.end(), url) != endpoints.end()) {
            throw RailError(ErrorCode::DuplicateEndpoint,
                            fmt::format("RPC URL {} is already configured for chain {}",
                                        util::mask_url(url), chain));
        }
    }

    require_healthy(chain, url);

    size_t position = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& endpoints = pools_[chain];
        // A full pool sheds its oldest backup, never the primary
        if (endpoints.size() >= max_size_) {
            spdlog::info("Chain {} pool full, evicting backup {}",
                         chain, util::mask_url(endpoints.back()));
            endpoints.pop_back();
        }
        endpoints.push_back(url);
        position = endpoints.size() - 1;
    }

    spdlog::info("Backup RPC {} added for chain {} at position {}",
                 util::mask_url(url), chain, position);
    flush();
}

std::vector<std::string> EndpointPool::rotate(int64_t chain_id) {
    uint64_t chain = validators::validate_chain_id(chain_id);
    auto chain_lock = lock_chain(chain);

    std::vector<std::string> rotated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(chain);
        if (it == pools_.end() || it->second.empty()) {
            throw RailError(ErrorCode::NoConfiguration,
                            fmt::format("No RPC configuration for chain {}", chain));
        }
        auto& endpoints = it->second;
        if (endpoints.size() < 2) {
            throw RailError(ErrorCode::NoBackupAvailable,
                            fmt::format("No backup RPCs to rotate for chain {}", chain),
                            "Use set_backup_rpc to add one");
        }
        std::rotate(endpoints.begin(), endpoints.begin() + 1, endpoints.end());
        rotated = endpoints;
    }

    spdlog::info("Rotated RPCs for chain {}: primary is now {}", chain, util::mask_url(rotated.front()));
    flush();
    return rotated;
}

void EndpointPool::remove(int64_t chain_id) {
    uint64_t chain = validators::validate_chain_id(chain_id);
    auto chain_lock = lock_chain(chain);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pools_.erase(chain) == 0) {
            throw RailError(ErrorCode::NotConfigured,
                            fmt::format("No RPC configuration found for chain {}", chain));
        }
    }

    spdlog::info("Removed RPC configuration for chain {}", chain);
    flush();
}

PoolMap EndpointPool::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_;
}

std::vector<std::string> EndpointPool::get(uint64_t chain_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(chain_id);
    if (it == pools_.end()) {
        return {};
    }
    return it->second;
}

bool EndpointPool::promote(uint64_t chain_id, const std::string& endpoint) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pools_.find(chain_id);
        if (it == pools_.end()) {
            return false;
        }
        auto& endpoints = it->second;
        auto pos = std::find(endpoints.begin(), endpoints.end(), endpoint);
        if (pos == endpoints.end()) {
            return false;
        }
        if (pos == endpoints.begin()) {
            return true;
        }
        std::rotate(endpoints.begin(), pos, pos + 1);
    }

    flush();
    return true;
}

void EndpointPool::flush() {
    if (!store_) return;

    // Snapshot and write under one lock so the file never regresses to an
    // older snapshot written late
    std::lock_guard<std::mutex> lock(flush_mutex_);
    if (!store_->save_pools(list())) {
        spdlog::warn("RPC pool change kept in memory only; persisting to {} failed", store_->path());
    }
}
