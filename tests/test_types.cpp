// Fixed-point, reference parsing and 256-bit arithmetic tests

#include <catch2/catch_test_macros.hpp>

#include "mocks.hpp"

using namespace omni;
using namespace omni_test;

TEST_CASE("X18 rescale", "[types]") {
    SECTION("Lossless up to truncation for common decimal counts") {
        // 1234.56789 at each precision
        REQUIRE(x18::rescale(1234, 0) == usd(1234));
        REQUIRE(x18::rescale(1234567890, 6) == x18::parse("1234567890000000000000").value());
        REQUIRE(x18::rescale(123456789000, 8) == x18::parse("1234567890000000000000").value());
        REQUIRE(x18::rescale(usd(1234), 18) == usd(1234));

        // 24 decimals truncates the six digits below 1e-18
        I128 fine = x18::parse("1234567890123456789999999").value();
        REQUIRE(x18::rescale(fine, 24) == x18::parse("1234567890123456789").value());
    }

    SECTION("Overflow is reported, not wrapped") {
        I128 huge = x18::parse("100000000000000000000000000000").value();  // 1e29
        REQUIRE_FALSE(x18::rescale(huge, 0).has_value());
    }

    SECTION("Beyond 10^38 resolution collapses to zero") {
        REQUIRE(x18::rescale(5, 60) == 0);
    }
}

TEST_CASE("X18 parse and render", "[types]") {
    REQUIRE(x18::to_string(usd(42)) == "42000000000000000000");
    REQUIRE(x18::to_string(I128(-7)) == "-7");
    REQUIRE(x18::parse("-15") == I128(-15));
    REQUIRE_FALSE(x18::parse("").has_value());
    REQUIRE_FALSE(x18::parse("12a").has_value());
    REQUIRE_FALSE(x18::parse("-").has_value());
    REQUIRE_FALSE(x18::parse("170141183460469231731687303715884105728").has_value());
    REQUIRE(x18::parse("170141183460469231731687303715884105727").has_value());
}

TEST_CASE("Address parsing", "[types]") {
    auto a = parse_address("0x00000000000000000000000000000000000000Ff");
    REQUIRE(a.has_value());
    REQUIRE((*a)[19] == 0xFF);
    REQUIRE(to_hex(*a) == "0x00000000000000000000000000000000000000ff");

    REQUIRE_FALSE(parse_address("0x1234").has_value());
    REQUIRE_FALSE(parse_address("00000000000000000000000000000000000000ff").has_value());
    REQUIRE_FALSE(parse_address("0xZZ000000000000000000000000000000000000ff").has_value());
    REQUIRE(is_zero(Address{}));
}

TEST_CASE("Enum names", "[types]") {
    REQUIRE(parse_feed_kind("confidence_interval") == FeedKind::CONFIDENCE_INTERVAL);
    REQUIRE_FALSE(parse_feed_kind("oracle").has_value());
    REQUIRE(parse_mode("consumer") == OracleMode::CONSUMER);
    REQUIRE(std::string(to_string(FeedKind::PUSH_AGGREGATE)) == "push_aggregate");
    REQUIRE(std::string(errors::to_string(errors::STALE_CROSS_CHAIN_DATA)) ==
            "stale cross-chain data");
}

TEST_CASE("U256 arithmetic", "[types][uint256]") {
    SECTION("Shifts cross the limb boundary") {
        U256 one(1);
        U256 big = U256::shl(one, 200);
        REQUIRE(big.lo == 0);
        REQUIRE(big.hi == (U128(1) << 72));
        REQUIRE(U256::shr(big, 200) == one);
    }

    SECTION("Wrapping subtraction") {
        U256 zero;
        U256 r = U256::wrapping_sub(zero, U256(1));
        REQUIRE(r.lo == ~U128(0));
        REQUIRE(r.hi == ~U128(0));
    }

    SECTION("Division keeps the full quotient") {
        U256 n = mul_u128(~U128(0), 1000);
        U256 q = U256::div(n, 1000);
        REQUIRE(q == U256(~U128(0)));
        REQUIRE(U256::div(n, 0).is_zero());
    }

    SECTION("Multiplication reports overflow") {
        U256 top = U256::shl(U256(1), 255);
        REQUIRE_FALSE(U256::mul(top, 2).has_value());
        REQUIRE(U256::mul(U256(3), 5).value() == U256(15));
    }

    SECTION("Decimal strings") {
        auto v = U256::from_string("340282366920938463463374607431768211456");  // 2^128
        REQUIRE(v.has_value());
        REQUIRE(*v == U256(0, 1));
        REQUIRE(v->to_string() == "340282366920938463463374607431768211456");
        REQUIRE_FALSE(U256::from_string("12x").has_value());
    }
}

TEST_CASE("mul_div", "[types][uint256]") {
    REQUIRE(mul_div(usd(3000), X18_ONE, usd(2)) == usd(1500));
    REQUIRE(mul_div(-10, 3, 4) == I128(-7));
    REQUIRE_FALSE(mul_div(1, 1, 0).has_value());

    // Intermediate beyond 128 bits, result in range
    I128 big = x18::parse("100000000000000000000000000000").value();  // 1e29
    REQUIRE(mul_div(big, big, big) == big);
}
