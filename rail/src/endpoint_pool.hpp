#pragma once

#include "config_store.hpp"
#include "health_checker.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Per-chain ordered endpoint lists: index 0 is the primary, the rest are
// backups in preference order. Lists are unique and bounded to max_size.
//
// Two lock levels: a striped chain mutex (chain_id % LOCK_STRIPES)
// serializes whole operations on one chain (including their probes), and
// mutex_ guards the map itself for the short in-memory edits. The stripe
// count is fixed, so unknown chain ids never allocate lock state.
class EndpointPool {
public:
    static constexpr size_t LOCK_STRIPES = 64;

    EndpointPool(std::shared_ptr<HealthChecker> checker,
                 std::shared_ptr<ConfigStore> store,
                 size_t max_size,
                 int probe_timeout_ms);

    // Adopt persisted pools without probing; duplicates and excess entries
    // are dropped
    void load(const PoolMap& pools);

    void set_primary(int64_t chain_id, const std::string& endpoint);
    void add_backup(int64_t chain_id, const std::string& endpoint);
    std::vector<std::string> rotate(int64_t chain_id);
    void remove(int64_t chain_id);

    PoolMap list() const;
    std::vector<std::string> get(uint64_t chain_id) const;
    size_t max_size() const { return max_size_; }

    // For the failover path: callers hold lock_chain() across their walk and
    // call promote() without re-probing
    std::unique_lock<std::mutex> lock_chain(uint64_t chain_id);
    bool promote(uint64_t chain_id, const std::string& endpoint);

private:
    std::shared_ptr<HealthChecker> checker_;
    std::shared_ptr<ConfigStore> store_;
    size_t max_size_;
    int probe_timeout_ms_;

    mutable std::mutex mutex_;
    PoolMap pools_;
    std::array<std::mutex, LOCK_STRIPES> chain_locks_;
    std::mutex flush_mutex_;

    void require_healthy(uint64_t chain_id, const std::string& endpoint) const;
    void truncate(std::vector<std::string>& endpoints) const;
    void flush();
};
