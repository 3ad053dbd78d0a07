#pragma once

#include "http_client.hpp"
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

struct HealthResult {
    bool healthy = false;
    std::optional<uint64_t> observed_chain_id;
    int64_t latency_ms = 0;
    std::string error;
};

// One bounded probe: liveness, chain id match, then a state read of the
// zero address. Never throws; every failure is folded into the result.
class HealthChecker {
public:
    explicit HealthChecker(std::shared_ptr<HttpClient> http);

    HealthResult check(const std::string& endpoint, uint64_t expected_chain_id, int timeout_ms) const;

private:
    std::shared_ptr<HttpClient> http_;
};
