#include <catch2/catch_test_macros.hpp>
#include "../src/health_checker.hpp"
#include "fake_http.hpp"

TEST_CASE("Endpoint health probe", "[health]") {
    auto http = std::make_shared<FakeHttpClient>();
    HealthChecker checker(http);

    SECTION("Reachable node on the right chain is healthy") {
        http->add_node("http://good.node");
        auto result = checker.check("http://good.node", 1, 1000);
        REQUIRE(result.healthy);
        REQUIRE(result.observed_chain_id == 1u);
        REQUIRE(result.error.empty());
        REQUIRE(result.latency_ms >= 0);
    }

    SECTION("Unreachable node is reported as not connected") {
        auto result = checker.check("http://nowhere.node", 1, 1000);
        REQUIRE_FALSE(result.healthy);
        REQUIRE(result.error == "not connected");
        REQUIRE_FALSE(result.observed_chain_id.has_value());
    }

    SECTION("Node on another chain is unhealthy and reports what it saw") {
        FakeNode polygon;
        polygon.chain_id = 137;
        http->add_node("http://polygon.node", polygon);

        auto result = checker.check("http://polygon.node", 1, 1000);
        REQUIRE_FALSE(result.healthy);
        REQUIRE(result.observed_chain_id == 137u);
        REQUIRE(result.error == "wrong chain id (expected 1, got 137)");
    }

    SECTION("Node that cannot serve state is unhealthy") {
        FakeNode pruned;
        pruned.state_ok = false;
        http->add_node("http://pruned.node", pruned);

        auto result = checker.check("http://pruned.node", 1, 1000);
        REQUIRE_FALSE(result.healthy);
        REQUIRE(result.error.find("missing trie node") != std::string::npos);
    }

    SECTION("Bad arguments never reach the network") {
        http->add_node("http://good.node");
        REQUIRE(checker.check("http://good.node", 0, 1000).error == "invalid expected chain id");
        REQUIRE(checker.check("http://good.node", 1, 0).error == "invalid timeout");
        REQUIRE(http->post_count("http://good.node") == 0);
    }
}
