#pragma once

#include "endpoint_pool.hpp"
#include "health_checker.hpp"
#include <memory>
#include <string>
#include <vector>

struct EndpointHealth {
    std::string endpoint;
    size_t position;     // 0 = primary
    HealthResult health;
};

class FailoverSelector {
public:
    FailoverSelector(std::shared_ptr<EndpointPool> pool,
                     std::shared_ptr<HealthChecker> checker,
                     int probe_timeout_ms);

    // First healthy endpoint in pool order; a healthy backup is promoted to
    // primary. Throws NoConfiguration or AllEndpointsFailed.
    std::string resolve(int64_t chain_id);

    // Probe every entry without reordering anything
    std::vector<EndpointHealth> check_pool_health(int64_t chain_id);

    static constexpr size_t MAX_REPORTED_FAILURES = 3;

private:
    std::shared_ptr<EndpointPool> pool_;
    std::shared_ptr<HealthChecker> checker_;
    int probe_timeout_ms_;
};
