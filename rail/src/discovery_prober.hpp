#pragma once

#include "chain_registry.hpp"
#include "health_checker.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

struct DiscoveryResult {
    uint64_t chain_id;
    std::vector<std::string> candidates;   // what was probed, at most max_candidates
    std::vector<std::string> healthy;      // in probe completion order
};

class DiscoveryProber {
public:
    DiscoveryProber(std::shared_ptr<ChainRegistryCache> registry,
                    std::shared_ptr<HealthChecker> checker,
                    size_t max_candidates,
                    size_t workers,
                    int probe_timeout_ms);

    // Throws NoReliableEndpoints when nothing passes, so an empty answer is
    // never mistaken for "the registry had no candidates"
    DiscoveryResult discover(int64_t chain_id);

    std::vector<std::string> select_candidates(uint64_t chain_id, const ChainRecords& records);

    void seed(uint32_t value);

private:
    std::shared_ptr<ChainRegistryCache> registry_;
    std::shared_ptr<HealthChecker> checker_;
    size_t max_candidates_;
    size_t workers_;
    int probe_timeout_ms_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    std::vector<std::string> probe_all(uint64_t chain_id, const std::vector<std::string>& candidates);
};
