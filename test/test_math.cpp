// lendcore - Fixed-Point Math Tests

#include <catch2/catch.hpp>
#include "mocks.hpp"

using namespace lendcore;
using namespace lendcore::test;

TEST_CASE("mul_div exact results", "[math]") {
    SECTION("Floors the quotient") {
        auto r = fixed::mul_div(10, 3, 4);
        REQUIRE(r.has_value());
        REQUIRE(*r == 7);
    }

    SECTION("Wide intermediate product") {
        // U128_MAX * U128_MAX overflows 128 bits but the quotient fits
        auto r = fixed::mul_div(U128_MAX, U128_MAX, U128_MAX);
        REQUIRE(r.has_value());
        REQUIRE(*r == U128_MAX);

        auto half = fixed::mul_div(U128_MAX, WAD, 2 * WAD);
        REQUIRE(half.has_value());
        REQUIRE(*half == U128_MAX / 2);
    }

    SECTION("Zero operands") {
        REQUIRE(*fixed::mul_div(0, U128_MAX, 7) == 0);
        REQUIRE(*fixed::mul_div(U128_MAX, 0, 7) == 0);
    }
}

TEST_CASE("mul_div failure modes", "[math]") {
    U128 out = 42;

    SECTION("Division by zero") {
        REQUIRE_FALSE(fixed::mul_div(1, 1, 0).has_value());
        REQUIRE(fixed::mul_div(1, 1, 0, out) == errors::DIVISION_BY_ZERO);
    }

    SECTION("Quotient does not fit") {
        REQUIRE_FALSE(fixed::mul_div(U128_MAX, 2, 1).has_value());
        REQUIRE(fixed::mul_div(U128_MAX, 2, 1, out) == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Success writes the result") {
        REQUIRE(fixed::mul_div(1000, 2 * WAD, WAD, out) == errors::OK);
        REQUIRE(out == 2000);
    }
}

TEST_CASE("Checked arithmetic", "[math]") {
    REQUIRE(*fixed::checked_add(1, 2) == 3);
    REQUIRE_FALSE(fixed::checked_add(U128_MAX, 1).has_value());

    REQUIRE(*fixed::checked_sub(5, 5) == 0);
    REQUIRE_FALSE(fixed::checked_sub(4, 5).has_value());

    REQUIRE(*fixed::checked_mul(0, U128_MAX) == 0);
    REQUIRE(*fixed::checked_mul(WAD, 1000) == 1000 * WAD);
    REQUIRE_FALSE(fixed::checked_mul(U128_MAX, 2).has_value());
}

TEST_CASE("Powers of ten and basis points", "[math]") {
    REQUIRE(*fixed::pow10(0) == 1);
    REQUIRE(*fixed::pow10(18) == WAD);
    REQUIRE(fixed::pow10(38).has_value());
    REQUIRE_FALSE(fixed::pow10(39).has_value());

    REQUIRE(*fixed::apply_bps(10000, 5000) == 5000);
    REQUIRE(*fixed::apply_bps(3, 5000) == 1);
}

TEST_CASE("128-bit decimal text", "[math]") {
    REQUIRE(to_string(static_cast<U128>(0)) == "0");
    REQUIRE(to_string(WAD) == "1000000000000000000");
    REQUIRE(to_string(U128_MAX) == "340282366920938463463374607431768211455");

    REQUIRE(*parse_u128("340282366920938463463374607431768211455") == U128_MAX);
    REQUIRE_FALSE(parse_u128("340282366920938463463374607431768211456").has_value());
    REQUIRE_FALSE(parse_u128("12a").has_value());
    REQUIRE_FALSE(parse_u128("").has_value());
}

TEST_CASE("Address helpers", "[types]") {
    REQUIRE(addresses::is_zero(addresses::ZERO));
    REQUIRE_FALSE(addresses::is_zero(ALICE));

    std::string hex = addresses::to_hex(ALICE);
    REQUIRE(hex == "0x000000000000000000000000000000000000000a");
    REQUIRE(*addresses::from_hex(hex) == ALICE);
    REQUIRE(*addresses::from_hex(hex.substr(2)) == ALICE);
    REQUIRE_FALSE(addresses::from_hex("0x1234").has_value());
    REQUIRE_FALSE(addresses::from_hex("0x00000000000000000000000000000000000000zz").has_value());
}
