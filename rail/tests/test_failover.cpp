#include <catch2/catch_test_macros.hpp>
#include "../src/failover_selector.hpp"
#include "../src/errors.hpp"
#include "fake_http.hpp"
#include <thread>

namespace {

struct Fixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<HealthChecker> checker = std::make_shared<HealthChecker>(http);
    std::shared_ptr<EndpointPool> pool = std::make_shared<EndpointPool>(checker, nullptr, 3, 1000);
    FailoverSelector selector{pool, checker, 1000};

    void seed(const std::vector<std::string>& urls) {
        for (const auto& url : urls) {
            http->add_node(url);
        }
        PoolMap pools;
        pools[1] = urls;
        pool->load(pools);
    }
};

} // namespace

TEST_CASE("Failover resolution", "[failover]") {
    Fixture f;

    SECTION("Healthy primary is used without reordering") {
        f.seed({"http://primary.node", "http://backup.node"});
        REQUIRE(f.selector.resolve(1) == "http://primary.node");
        REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://primary.node", "http://backup.node"});
        REQUIRE(f.http->post_count("http://backup.node") == 0);
    }

    SECTION("Dead primary fails over and the backup is promoted") {
        f.seed({"http://primary.node", "http://backup.node"});
        f.http->set_up("http://primary.node", false);

        REQUIRE(f.selector.resolve(1) == "http://backup.node");
        REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://backup.node", "http://primary.node"});

        // The next resolve goes straight to the promoted endpoint
        size_t primary_probes = f.http->post_count("http://primary.node");
        REQUIRE(f.selector.resolve(1) == "http://backup.node");
        REQUIRE(f.http->post_count("http://primary.node") == primary_probes);
    }

    SECTION("Concurrent resolves on one chain promote once") {
        f.seed({"http://dead.node", "http://good.node"});
        f.http->set_up("http://dead.node", false);

        std::string first;
        std::string second;
        std::thread t1([&]() { first = f.selector.resolve(1); });
        std::thread t2([&]() { second = f.selector.resolve(1); });
        t1.join();
        t2.join();

        REQUIRE(first == "http://good.node");
        REQUIRE(second == "http://good.node");
        REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://good.node", "http://dead.node"});
        // The second walk starts at the promoted endpoint
        REQUIRE(f.http->post_count("http://dead.node") == 1);
    }

    SECTION("Promotion keeps the relative order of the rest") {
        f.seed({"http://a.node", "http://b.node", "http://c.node"});
        f.http->set_up("http://a.node", false);
        f.http->set_up("http://b.node", false);

        REQUIRE(f.selector.resolve(1) == "http://c.node");
        REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://c.node", "http://a.node", "http://b.node"});
    }

    SECTION("All endpoints down leaves the order untouched") {
        f.seed({"http://a.node", "http://b.node"});
        f.http->set_up("http://a.node", false);
        f.http->set_up("http://b.node", false);

        try {
            f.selector.resolve(1);
            FAIL("expected AllEndpointsFailed");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::AllEndpointsFailed);
            std::string message = e.what();
            REQUIRE(message.find("http://a.node") != std::string::npos);
            REQUIRE(message.find("http://b.node") != std::string::npos);
        }
        REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://a.node", "http://b.node"});
    }

    SECTION("Single dead endpoint is named in the failure") {
        f.seed({"http://only.node"});
        f.http->set_up("http://only.node", false);
        try {
            f.selector.resolve(1);
            FAIL("expected AllEndpointsFailed");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::AllEndpointsFailed);
            REQUIRE(std::string(e.what()) == "All RPCs failed for chain 1: http://only.node");
        }
    }

    SECTION("Unconfigured chain") {
        try {
            f.selector.resolve(10);
            FAIL("expected NoConfiguration");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::NoConfiguration);
        }
    }

    SECTION("Invalid chain id") {
        REQUIRE_THROWS_AS(f.selector.resolve(-1), RailError);
    }
}

TEST_CASE("Failure summary is truncated", "[failover]") {
    auto http = std::make_shared<FakeHttpClient>();
    auto checker = std::make_shared<HealthChecker>(http);
    auto pool = std::make_shared<EndpointPool>(checker, nullptr, 5, 1000);
    FailoverSelector selector(pool, checker, 1000);

    PoolMap pools;
    pools[1] = {"http://a.node", "http://b.node", "http://c.node", "http://d.node", "http://e.node"};
    pool->load(pools);

    try {
        selector.resolve(1);
        FAIL("expected AllEndpointsFailed");
    } catch (const RailError& e) {
        std::string message = e.what();
        REQUIRE(message.find("http://c.node") != std::string::npos);
        REQUIRE(message.find("http://d.node") == std::string::npos);
        REQUIRE(message.find("(+2 more)") != std::string::npos);
    }
}

TEST_CASE("Pool health report", "[failover]") {
    Fixture f;
    f.seed({"http://a.node", "http://b.node"});
    f.http->set_up("http://a.node", false);

    auto report = f.selector.check_pool_health(1);
    REQUIRE(report.size() == 2);
    REQUIRE(report[0].position == 0);
    REQUIRE_FALSE(report[0].health.healthy);
    REQUIRE(report[1].health.healthy);

    // Reporting never reorders
    REQUIRE(f.pool->get(1) == std::vector<std::string>{"http://a.node", "http://b.node"});
}
