#include "health_checker.hpp"
#include "evm_rpc.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>

namespace {
constexpr const char* ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";
}

HealthChecker::HealthChecker(std::shared_ptr<HttpClient> http)
    : http_(std::move(http))
{}

HealthResult HealthChecker::check(const std::string& endpoint, uint64_t expected_chain_id, int timeout_ms) const {
    HealthResult result;

    if (expected_chain_id == 0) {
        result.error = "invalid expected chain id";
        return result;
    }
    if (timeout_ms <= 0) {
        result.error = "invalid timeout";
        return result;
    }

    auto start = std::chrono::steady_clock::now();

    try {
        EvmRpcClient rpc(http_, endpoint, timeout_ms);

        try {
            rpc.client_version();
        } catch (const std::exception& e) {
            spdlog::debug("Probe {} not connected: {}", util::mask_url(endpoint), e.what());
            result.error = "not connected";
            return result;
        }

        uint64_t actual = rpc.chain_id();
        result.observed_chain_id = actual;
        if (actual != expected_chain_id) {
            result.error = fmt::format("wrong chain id (expected {}, got {})", expected_chain_id, actual);
            return result;
        }

        rpc.get_balance(ZERO_ADDRESS);

        result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        result.healthy = true;

    } catch (const std::exception& e) {
        result.healthy = false;
        result.error = e.what();
    }

    spdlog::debug("Probe {} chain {}: {} ({} ms)", util::mask_url(endpoint), expected_chain_id,
                  result.healthy ? "healthy" : result.error, result.latency_ms);
    return result;
}
