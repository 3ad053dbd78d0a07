#include <catch2/catch_test_macros.hpp>
#include "../src/api_key_store.hpp"
#include "../src/errors.hpp"
#include <cstdio>
#include <filesystem>

TEST_CASE("API key store", "[api_keys]") {
    ApiKeyStore keys(nullptr);

    SECTION("Provider names are case-insensitive") {
        keys.set("Etherscan", "test123456789");
        REQUIRE(keys.get("etherscan") == std::optional<std::string>("test123456789"));
        REQUIRE(keys.get("ETHERSCAN").has_value());
        REQUIRE_FALSE(keys.get("bscscan").has_value());
    }

    SECTION("Display is masked") {
        keys.set("etherscan", "test123456789");
        REQUIRE(keys.masked().at("etherscan") == "test...6789");
    }

    SECTION("Removing an unknown provider is an error") {
        try {
            keys.remove("etherscan");
            FAIL("expected NotConfigured");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::NotConfigured);
            REQUIRE(std::string(e.what()) == "API key for etherscan not found");
        }
    }

    SECTION("Empty values are rejected") {
        REQUIRE_THROWS_AS(keys.set("", "abc"), RailError);
        REQUIRE_THROWS_AS(keys.set("etherscan", ""), RailError);
    }
}

TEST_CASE("Encrypted API keys", "[api_keys][crypto]") {
    auto path = (std::filesystem::temp_directory_path() / "chainrail_keys_test.json").string();
    std::remove(path.c_str());

    auto store = std::make_shared<ConfigStore>(path);
    {
        ApiKeyStore keys(store);
        keys.set("etherscan", "plain-secret-value");
        keys.enable_encryption("hunter22");
        REQUIRE(keys.encryption_enabled());
        REQUIRE(keys.get("etherscan") == std::optional<std::string>("plain-secret-value"));
    }

    auto stored = ConfigStore(path).load();
    REQUIRE(stored.encryption.enabled);
    REQUIRE(stored.api_keys.at("etherscan") != "plain-secret-value");

    SECTION("The same password unlocks a later process") {
        ApiKeyStore keys(nullptr);
        keys.load(stored.api_keys, stored.encryption);
        keys.enable_encryption("hunter22");
        REQUIRE(keys.get("etherscan") == std::optional<std::string>("plain-secret-value"));
    }

    SECTION("A wrong password is refused up front") {
        ApiKeyStore keys(nullptr);
        keys.load(stored.api_keys, stored.encryption);
        REQUIRE_THROWS_AS(keys.enable_encryption("wrong"), RailError);
    }

    SECTION("Without a password encrypted keys stay hidden") {
        ApiKeyStore keys(nullptr);
        keys.load(stored.api_keys, stored.encryption);
        REQUIRE(keys.masked().at("etherscan") == "(encrypted)");
        REQUIRE_THROWS_AS(keys.get("etherscan"), RailError);
        REQUIRE_THROWS_AS(keys.set("bscscan", "abc"), RailError);
    }

    std::remove(path.c_str());
}
