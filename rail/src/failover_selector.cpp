#include "failover_selector.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "validators.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <unordered_set>

FailoverSelector::FailoverSelector(std::shared_ptr<EndpointPool> pool,
                                   std::shared_ptr<HealthChecker> checker,
                                   int probe_timeout_ms)
    : pool_(std::move(pool))
    , checker_(std::move(checker))
    , probe_timeout_ms_(probe_timeout_ms)
{}

std::string FailoverSelector::resolve(int64_t chain_id) {
    uint64_t chain = validators::validate_chain_id(chain_id);

    // Concurrent resolves on one chain queue here; the second one then
    // finds the freshly promoted primary first
    auto chain_lock = pool_->lock_chain(chain);

    auto endpoints = pool_->get(chain);
    if (endpoints.empty()) {
        throw RailError(ErrorCode::NoConfiguration,
                        fmt::format("No RPC configuration for chain {}", chain),
                        fmt::format("Use set_rpc({}, '<url>') first", chain));
    }

    std::unordered_set<std::string> visited;
    std::vector<std::string> failed;

    for (size_t i = 0; i < endpoints.size(); i++) {
        const auto& endpoint = endpoints[i];
        if (!visited.insert(endpoint).second) {
            continue;
        }

        auto health = checker_->check(endpoint, chain, probe_timeout_ms_);
        if (!health.healthy) {
            spdlog::warn("RPC {} for chain {} failed health check: {}",
                         util::mask_url(endpoint), chain, health.error);
            failed.push_back(endpoint);
            continue;
        }

        if (i > 0) {
            if (pool_->promote(chain, endpoint)) {
                spdlog::warn("Failover on chain {}: demoted {}, promoted {}",
                             chain, util::mask_url(endpoints[0]), util::mask_url(endpoint));
            } else {
                spdlog::warn("Failover on chain {}: {} no longer in pool, not promoted",
                             chain, util::mask_url(endpoint));
            }
        }
        return endpoint;
    }

    std::vector<std::string> reported;
    for (size_t i = 0; i < failed.size() && i < MAX_REPORTED_FAILURES; i++) {
        reported.push_back(util::mask_url(failed[i]));
    }
    std::string summary = util::join(reported, ", ");
    if (failed.size() > MAX_REPORTED_FAILURES) {
        summary += fmt::format(", ... (+{} more)", failed.size() - MAX_REPORTED_FAILURES);
    }

    throw RailError(ErrorCode::AllEndpointsFailed,
                    fmt::format("All RPCs failed for chain {}: {}", chain, summary),
                    "Add a working RPC with set_rpc or query_rpc_urls");
}

std::vector<EndpointHealth> FailoverSelector::check_pool_health(int64_t chain_id) {
    uint64_t chain = validators::validate_chain_id(chain_id);

    auto endpoints = pool_->get(chain);
    if (endpoints.empty()) {
        throw RailError(ErrorCode::NoConfiguration,
                        fmt::format("No RPC configuration for chain {}", chain));
    }

    std::vector<EndpointHealth> report;
    report.reserve(endpoints.size());
    for (size_t i = 0; i < endpoints.size(); i++) {
        report.push_back({endpoints[i], i, checker_->check(endpoints[i], chain, probe_timeout_ms_)});
    }
    return report;
}
