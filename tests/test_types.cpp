// crowdsale - Address, Amount and Error Code Tests

#include <catch2/catch.hpp>
#include <crowdsale/types.hpp>

using namespace crowdsale;

TEST_CASE("Address hex encoding", "[types]") {
    Address addr = addresses::from_u64(0xABCDEF);

    SECTION("Lowercase with 0x prefix") {
        REQUIRE(addresses::to_hex(addr) == "0x0000000000000000000000000000000000abcdef");
    }

    SECTION("Parses with or without prefix, any case") {
        auto with_prefix = addresses::from_hex("0x0000000000000000000000000000000000ABCDEF");
        auto bare = addresses::from_hex("0000000000000000000000000000000000abcdef");
        REQUIRE(with_prefix.has_value());
        REQUIRE(bare.has_value());
        REQUIRE(*with_prefix == addr);
        REQUIRE(*bare == addr);
    }

    SECTION("Rejects bad length and digits") {
        REQUIRE_FALSE(addresses::from_hex("0x1234").has_value());
        REQUIRE_FALSE(addresses::from_hex("0x000000000000000000000000000000000000000g").has_value());
        REQUIRE_FALSE(addresses::from_hex("").has_value());
    }

    SECTION("Zero address") {
        REQUIRE(addresses::is_zero(addresses::ZERO));
        REQUIRE_FALSE(addresses::is_zero(addr));
    }
}

TEST_CASE("Checked amount arithmetic", "[types]") {
    SECTION("pow10 limits") {
        REQUIRE(*amount::pow10(0) == 1);
        REQUIRE(*amount::pow10(18) == static_cast<Amount>(1000000000000000000ULL));
        REQUIRE(amount::pow10(38).has_value());
        REQUIRE_FALSE(amount::pow10(39).has_value());
    }

    SECTION("Add and multiply detect overflow") {
        REQUIRE(*amount::checked_add(2, 3) == 5);
        REQUIRE_FALSE(amount::checked_add(AMOUNT_MAX, 1).has_value());
        REQUIRE(*amount::checked_mul(AMOUNT_MAX, 1) == AMOUNT_MAX);
        REQUIRE_FALSE(amount::checked_mul(AMOUNT_MAX, 2).has_value());
        REQUIRE(*amount::checked_mul(0, AMOUNT_MAX) == 0);
    }
}

TEST_CASE("mul_div uses a wide intermediate", "[types]") {
    SECTION("Small operands truncate") {
        REQUIRE(*amount::mul_div(7, 3, 2) == 10);
        REQUIRE(*amount::mul_div(1, 1, 3) == 0);
    }

    SECTION("Product past 128 bits still divides exactly") {
        REQUIRE(*amount::mul_div(AMOUNT_MAX, 6, 12) == AMOUNT_MAX / 2);
        REQUIRE(*amount::mul_div(AMOUNT_MAX, AMOUNT_MAX, AMOUNT_MAX) == AMOUNT_MAX);
    }

    SECTION("Price times payment over 10^36") {
        Amount price = *amount::pow10(20);       // $100 at 18 decimals
        Amount paid = *amount::pow10(18) * 5;    // 5 whole coins
        Amount scale = *amount::pow10(36);
        REQUIRE(*amount::mul_div(price, paid, scale) == 500);
    }

    SECTION("Zero denominator and oversized quotient") {
        REQUIRE_FALSE(amount::mul_div(1, 1, 0).has_value());
        REQUIRE_FALSE(amount::mul_div(AMOUNT_MAX, 4, 2).has_value());
    }
}

TEST_CASE("Amount decimal strings", "[types]") {
    REQUIRE(amount::to_string(static_cast<Amount>(0)) == "0");
    REQUIRE(amount::to_string(AMOUNT_MAX) == "340282366920938463463374607431768211455");
    REQUIRE(amount::to_string(static_cast<I128>(-42)) == "-42");

    REQUIRE(*amount::parse("340282366920938463463374607431768211455") == AMOUNT_MAX);
    REQUIRE_FALSE(amount::parse("340282366920938463463374607431768211456").has_value());
    REQUIRE_FALSE(amount::parse("12a").has_value());
    REQUIRE_FALSE(amount::parse("-1").has_value());
    REQUIRE_FALSE(amount::parse("").has_value());
}

TEST_CASE("Error taxonomy", "[types][errors]") {
    REQUIRE(error_kind(errors::OK) == ErrorKind::NONE);
    REQUIRE(error_kind(errors::ZERO_ADDRESS) == ErrorKind::VALIDATION);
    REQUIRE(error_kind(errors::ALREADY_DISABLED) == ErrorKind::STATE);
    REQUIRE(error_kind(errors::ORACLE_STALE_OR_INVALID) == ErrorKind::ORACLE);
    REQUIRE(error_kind(errors::STAGE_CAPACITY) == ErrorKind::INSUFFICIENT_SUPPLY);
    REQUIRE(error_kind(errors::LIMIT_EXCEEDED) == ErrorKind::LIMIT_EXCEEDED);
    REQUIRE(error_kind(errors::RELEASE_FAILED) == ErrorKind::EXTERNAL);
    REQUIRE(error_kind(errors::UNAUTHORIZED) == ErrorKind::UNAUTHORIZED);
    REQUIRE(error_kind(errors::REENTRANCY) == ErrorKind::REENTRANCY);

    REQUIRE(std::string(error_name(errors::ALREADY_DISABLED)) == "StateError::AlreadyDisabled");
    REQUIRE(std::string(error_name(errors::ORACLE_STALE_OR_INVALID)) == "OracleError::StaleOrInvalid");
    REQUIRE(std::string(error_name(errors::LIMIT_EXCEEDED)) == "LimitExceeded");
    REQUIRE(std::string(error_name(12345)) == "UnknownError");
}
