#include <catch2/catch_test_macros.hpp>
#include "../src/tools.hpp"
#include "fake_http.hpp"

namespace {

const std::string REGISTRY_URL = "https://registry.test/chains.json";

struct Fixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<HealthChecker> checker = std::make_shared<HealthChecker>(http);
    std::shared_ptr<EndpointPool> pool = std::make_shared<EndpointPool>(checker, nullptr, 3, 1000);
    std::shared_ptr<FailoverSelector> selector = std::make_shared<FailoverSelector>(pool, checker, 1000);
    std::shared_ptr<ChainRegistryCache> registry =
        std::make_shared<ChainRegistryCache>(http, REGISTRY_URL, 1000, 3600, "");
    std::shared_ptr<DiscoveryProber> prober = std::make_shared<DiscoveryProber>(registry, checker, 10, 5, 1000);
    std::shared_ptr<ChainReader> reader = std::make_shared<ChainReader>(selector, http, 1000);
    std::shared_ptr<ApiKeyStore> keys = std::make_shared<ApiKeyStore>(nullptr);
    std::shared_ptr<SourceLookup> sources = std::make_shared<SourceLookup>(
        http, "https://sourcify.test", "https://etherscan.test/api", keys, "", 1000);
    ToolService tools{pool, selector, prober, reader, sources, keys};

    bool starts_with(const std::string& text, const std::string& prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }
};

} // namespace

TEST_CASE("RPC management tools", "[tools]") {
    Fixture f;
    f.http->add_node("http://rpc1.com");
    f.http->add_node("http://rpc2.com");

    SECTION("set_rpc then list_configs") {
        auto reply = f.tools.set_rpc(1, "http://rpc1.com");
        REQUIRE(reply.ok);
        REQUIRE(reply.message == "Success: RPC URL for chain ID 1 set to http://rpc1.com");

        auto listing = f.tools.list_configs();
        REQUIRE(listing.ok);
        REQUIRE(listing.message.find("Chain 1:") != std::string::npos);
        REQUIRE(listing.message.find("Primary: http://rpc1.com") != std::string::npos);
        REQUIRE(listing.message.find("No API keys configured") != std::string::npos);
    }

    SECTION("set_rpc against a dead endpoint") {
        auto reply = f.tools.set_rpc(1, "http://dead.com");
        REQUIRE_FALSE(reply.ok);
        REQUIRE(f.starts_with(reply.message, "Error: "));
        REQUIRE(f.tools.list_configs().message.find("No RPCs configured") != std::string::npos);
    }

    SECTION("Backups, rotation and deletion") {
        f.tools.set_rpc(1, "http://rpc1.com");
        REQUIRE(f.tools.set_backup_rpc(1, "http://rpc2.com").ok);
        REQUIRE(f.tools.list_configs().message.find("Backup 1: http://rpc2.com") != std::string::npos);

        auto rotated = f.tools.rotate_rpc(1);
        REQUIRE(rotated.ok);
        REQUIRE(rotated.message.find("New primary: http://rpc2.com") != std::string::npos);

        REQUIRE(f.tools.delete_rpc(1).ok);
        auto again = f.tools.delete_rpc(1);
        REQUIRE_FALSE(again.ok);
        REQUIRE(again.message.find("No RPC configuration found for chain 1") != std::string::npos);
    }

    SECTION("Duplicate backup is refused") {
        f.tools.set_rpc(1, "http://rpc1.com");
        auto reply = f.tools.set_backup_rpc(1, "http://rpc1.com");
        REQUIRE_FALSE(reply.ok);
        REQUIRE(reply.message.find("already configured") != std::string::npos);
    }

    SECTION("Health report marks each endpoint") {
        f.tools.set_rpc(1, "http://rpc1.com");
        f.tools.set_backup_rpc(1, "http://rpc2.com");
        f.http->set_up("http://rpc2.com", false);

        auto reply = f.tools.check_rpc_health(1);
        REQUIRE(reply.ok);
        REQUIRE(reply.message.find("=== RPC Health for Chain 1 ===") != std::string::npos);
        REQUIRE(reply.message.find("Primary: http://rpc1.com - ✓ Healthy") != std::string::npos);
        REQUIRE(reply.message.find("Backup 1: http://rpc2.com - ✗ Unhealthy") != std::string::npos);
    }
}

TEST_CASE("API key tools", "[tools]") {
    Fixture f;

    REQUIRE(f.tools.set_api_key("etherscan", "test123456789").ok);
    auto listing = f.tools.list_configs();
    REQUIRE(listing.message.find("etherscan: test...6789") != std::string::npos);
    REQUIRE(listing.message.find("test123456789") == std::string::npos);

    REQUIRE(f.tools.delete_api_key("etherscan").ok);
    auto missing = f.tools.delete_api_key("etherscan");
    REQUIRE_FALSE(missing.ok);
    REQUIRE(missing.message == "Error: API key for etherscan not found");
}

TEST_CASE("Chain read tools", "[tools]") {
    Fixture f;

    FakeNode node;
    node.balance = "0x1bc16d674ec80000";   // 2 ether
    node.calls["0x70a08231"] = "0x" + std::string(58, '0') + "0f4240";   // 1000000
    node.calls["0x313ce567"] = "0x" + std::string(63, '0') + "6";
    f.http->add_node("http://rpc1.com", node);
    f.tools.set_rpc(1, "http://rpc1.com");

    SECTION("Native balance") {
        auto reply = f.tools.check_native_balance(1, "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
        REQUIRE(reply.ok);
        REQUIRE(reply.message == "2 ETH");
    }

    SECTION("Token balance") {
        auto reply = f.tools.get_token_balance(1, "0x6b175474e89094c44da98b954eedeac495271d0f",
                                               "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
        REQUIRE(reply.ok);
        REQUIRE(reply.message.find("Balance: 1.000000") != std::string::npos);
    }

    SECTION("Malformed contract reply is an error reply") {
        f.http->set_call("http://rpc1.com", "0x06fdde03",
                         "0x" + std::string(56, '0') + "g0000000" + std::string(64, '0'));
        auto reply = f.tools.get_token_info(1, "0x6b175474e89094c44da98b954eedeac495271d0f");
        REQUIRE_FALSE(reply.ok);
        REQUIRE(f.starts_with(reply.message, "Error: "));
    }

    SECTION("Unconfigured chain") {
        auto reply = f.tools.check_native_balance(5, "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
        REQUIRE_FALSE(reply.ok);
        REQUIRE(reply.message.find("No RPC configuration for chain 5") != std::string::npos);
    }
}

TEST_CASE("Discovery tool", "[tools]") {
    Fixture f;
    f.http->add_node("https://eth.good");
    f.http->set_get(REGISTRY_URL, 200,
                    R"([{"chainId": 1, "rpc": ["https://eth.good", "https://eth.down"]}])");

    auto reply = f.tools.query_rpc_urls(1);
    REQUIRE(reply.ok);
    REQUIRE(reply.message == "https://eth.good");

    auto none = f.tools.query_rpc_urls(999);
    REQUIRE_FALSE(none.ok);
    REQUIRE(none.message.find("No reliable RPC URLs found") != std::string::npos);
}

TEST_CASE("JSON dispatch", "[tools]") {
    Fixture f;
    f.http->add_node("http://rpc1.com");

    auto reply = f.tools.dispatch("set_rpc", {{"chain_id", 1}, {"rpc_url", "http://rpc1.com"}});
    REQUIRE(reply["ok"] == true);
    REQUIRE(reply.contains("ts"));

    auto bad_args = f.tools.dispatch("set_rpc", {{"chain_id", "one"}});
    REQUIRE(bad_args["ok"] == false);
    REQUIRE(bad_args["message"].get<std::string>().find("Invalid arguments") != std::string::npos);

    auto unknown = f.tools.dispatch("launch_rockets", nlohmann::json::object());
    REQUIRE(unknown["ok"] == false);

    REQUIRE(ToolService::tool_names().size() == 13);
}
