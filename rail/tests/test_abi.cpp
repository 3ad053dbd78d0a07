#include <catch2/catch_test_macros.hpp>
#include "../src/abi.hpp"
#include "../src/errors.hpp"
#include <string>

namespace {
// "Dai Stablecoin" as returned by name()
const std::string DAI_NAME =
    "0x0000000000000000000000000000000000000000000000000000000000000020"
    "000000000000000000000000000000000000000000000000000000000000000e"
    "44616920537461626c65636f696e000000000000000000000000000000000000";
}

TEST_CASE("Hex to decimal conversion", "[abi]") {
    REQUIRE(abi::hex_to_decimal("0x0") == "0");
    REQUIRE(abi::hex_to_decimal("0xff") == "255");
    REQUIRE(abi::hex_to_decimal("0xde0b6b3a7640000") == "1000000000000000000");

    SECTION("Values beyond 64 bits stay exact") {
        REQUIRE(abi::hex_to_decimal("0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff")
                == "115792089237316195423570985008687907853269984665640564039457584007913129639935");
    }

    SECTION("Non-hex input is a contract call failure") {
        try {
            abi::hex_to_decimal("0x12g4");
            FAIL("expected ContractCallFailed");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::ContractCallFailed);
        }
    }
}

TEST_CASE("Unit formatting", "[abi]") {
    REQUIRE(abi::format_units("1000000000000000000", 18) == "1.000000000000000000");
    REQUIRE(abi::format_units("500000", 6) == "0.500000");
    REQUIRE(abi::format_units("1500000", 6) == "1.500000");
    REQUIRE(abi::format_units("0", 6) == "0.000000");
    REQUIRE(abi::format_units("42", 0) == "42");

    REQUIRE(abi::trim_fraction("1.500000") == "1.5");
    REQUIRE(abi::trim_fraction("2.000000000000000000") == "2");
    REQUIRE(abi::trim_fraction("42") == "42");
}

TEST_CASE("ABI decoding", "[abi]") {
    SECTION("Dynamic string") {
        REQUIRE(abi::decode_string(DAI_NAME) == "Dai Stablecoin");
    }

    SECTION("bytes32 string from legacy tokens") {
        REQUIRE(abi::decode_string("0x4d4b520000000000000000000000000000000000000000000000000000000000") == "MKR");
    }

    SECTION("Small uint with a ceiling") {
        std::string eighteen = "0x0000000000000000000000000000000000000000000000000000000000000012";
        REQUIRE(abi::decode_small_uint(eighteen, 255) == 18);

        std::string huge = "0x0000000000000000000000000000000000000000000000000000000000001000";
        REQUIRE_THROWS_AS(abi::decode_small_uint(huge, 255), RailError);
    }

    SECTION("Empty return data is rejected") {
        REQUIRE_THROWS_AS(abi::decode_uint256("0x"), RailError);
        REQUIRE_THROWS_AS(abi::decode_string("0x"), RailError);
    }

    SECTION("Non-hex offset word is a contract call failure") {
        std::string malformed = "0x" + std::string(56, '0') + "g0000000" + std::string(64, '0');
        try {
            abi::decode_string(malformed);
            FAIL("expected ContractCallFailed");
        } catch (const RailError& e) {
            REQUIRE(e.code() == ErrorCode::ContractCallFailed);
        }
    }

    SECTION("balanceOf calldata pads the holder") {
        REQUIRE(abi::encode_address_call(abi::SELECTOR_BALANCE_OF, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed")
                == "0x70a08231" "0000000000000000000000005aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    }
}
