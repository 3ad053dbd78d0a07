#include "discovery_prober.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "validators.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <thread>

DiscoveryProber::DiscoveryProber(std::shared_ptr<ChainRegistryCache> registry,
                                 std::shared_ptr<HealthChecker> checker,
                                 size_t max_candidates,
                                 size_t workers,
                                 int probe_timeout_ms)
    : registry_(std::move(registry))
    , checker_(std::move(checker))
    , max_candidates_(std::max<size_t>(max_candidates, 1))
    , workers_(std::max<size_t>(workers, 1))
    , probe_timeout_ms_(probe_timeout_ms)
    , rng_(std::random_device{}())
{}

void DiscoveryProber::seed(uint32_t value) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    rng_.seed(value);
}

std::vector<std::string> DiscoveryProber::select_candidates(uint64_t chain_id, const ChainRecords& records) {
    std::vector<std::string> raw;
    for (const auto& record : records) {
        if (record.chain_id == chain_id) {
            raw.insert(raw.end(), record.rpc.begin(), record.rpc.end());
        }
    }

    {
        // Registry order is biased towards the same few providers
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::shuffle(raw.begin(), raw.end(), rng_);
    }

    std::vector<std::string> candidates;
    for (const auto& url : raw) {
        if (candidates.size() >= max_candidates_) break;
        if (!validators::is_valid_endpoint_url(url)) continue;
        if (std::find(candidates.begin(), candidates.end(), url) != candidates.end()) continue;
        candidates.push_back(url);
    }
    return candidates;
}

std::vector<std::string> DiscoveryProber::probe_all(uint64_t chain_id, const std::vector<std::string>& candidates) {
    std::vector<std::string> healthy;
    std::mutex healthy_mutex;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            size_t index = next.fetch_add(1);
            if (index >= candidates.size()) return;

            const auto& url = candidates[index];
            auto result = checker_->check(url, chain_id, probe_timeout_ms_);
            if (result.healthy) {
                std::lock_guard<std::mutex> lock(healthy_mutex);
                healthy.push_back(url);
            } else {
                spdlog::debug("Discovery candidate {} rejected: {}", util::mask_url(url), result.error);
            }
        }
    };

    size_t thread_count = std::min(workers_, candidates.size());
    std::vector<std::thread> pool;
    pool.reserve(thread_count);
    for (size_t i = 0; i < thread_count; i++) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) {
        t.join();
    }

    return healthy;
}

DiscoveryResult DiscoveryProber::discover(int64_t chain_id) {
    uint64_t chain = validators::validate_chain_id(chain_id);

    auto records = registry_->get();

    DiscoveryResult result;
    result.chain_id = chain;
    result.candidates = select_candidates(chain, *records);

    if (result.candidates.empty()) {
        throw RailError(ErrorCode::NoReliableEndpoints,
                        fmt::format("No reliable RPC URLs found for chain {}: registry lists no usable candidates",
                                    chain));
    }

    spdlog::info("Probing {} candidate RPCs for chain {} with {} workers",
                 result.candidates.size(), chain, std::min(workers_, result.candidates.size()));

    result.healthy = probe_all(chain, result.candidates);

    if (result.healthy.empty()) {
        throw RailError(ErrorCode::NoReliableEndpoints,
                        fmt::format("No reliable RPC URLs found for chain {}: all {} candidates failed",
                                    chain, result.candidates.size()));
    }

    spdlog::info("Discovery for chain {}: {}/{} candidates healthy",
                 chain, result.healthy.size(), result.candidates.size());
    return result;
}
