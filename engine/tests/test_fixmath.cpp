#include <catch2/catch_test_macros.hpp>
#include "../src/fixmath.hpp"
#include <stdexcept>

using fixmath::Rounding;

TEST_CASE("Fixed-point parsing and formatting", "[fixmath]") {
    SECTION("Decimal strings parse exactly") {
        REQUIRE(fixmath::from_string("1.05") == 1050000000);
        REQUIRE(fixmath::from_string("0.000000001") == 1);
        REQUIRE(fixmath::from_string("-2.5") == -2500000000);
        REQUIRE(fixmath::from_string("20000") == 20000 * fixmath::FIX_ONE);
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_THROWS_AS(fixmath::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(fixmath::from_string("1.2.3"), std::invalid_argument);
        REQUIRE_THROWS_AS(fixmath::from_string("abc"), std::invalid_argument);
        REQUIRE_THROWS_AS(fixmath::from_string("0.0000000001"), std::invalid_argument);
    }

    SECTION("Formatting trims trailing zeros") {
        REQUIRE(fixmath::to_string(fixmath::from_string("0.945")) == "0.945");
        REQUIRE(fixmath::to_string(fixmath::FIX_ONE * 3) == "3");
        REQUIRE(fixmath::to_string(-500000000) == "-0.5");
    }

    SECTION("Doubles convert to the nearest value") {
        REQUIRE(fixmath::from_double(1.05) == 1050000000);
        REQUIRE(fixmath::to_double(fixmath::from_string("0.25")) == 0.25);
    }
}

TEST_CASE("Fixed-point arithmetic rounding", "[fixmath]") {
    Fix third = fixmath::div(fixmath::FIX_ONE, fixmath::from_int(3), Rounding::Floor);

    SECTION("Floor, round and ceil differ on inexact results") {
        REQUIRE(third == 333333333);
        REQUIRE(fixmath::div(fixmath::FIX_ONE, fixmath::from_int(3), Rounding::Ceil) == 333333334);
        REQUIRE(fixmath::div(fixmath::from_int(2), fixmath::from_int(3), Rounding::Round) == 666666667);
    }

    SECTION("Exact products are unaffected by rounding mode") {
        Fix a = fixmath::from_string("1.05");
        Fix b = fixmath::from_string("0.9");
        REQUIRE(fixmath::mul(a, b, Rounding::Floor) == fixmath::from_string("0.945"));
        REQUIRE(fixmath::mul(a, b, Rounding::Ceil) == fixmath::from_string("0.945"));
    }

    SECTION("Ceil rounds a tiny positive product up") {
        REQUIRE(fixmath::mul(1, 1, Rounding::Floor) == 0);
        REQUIRE(fixmath::mul(1, 1, Rounding::Ceil) == 1);
    }

    SECTION("Overflow and division by zero throw") {
        REQUIRE_THROWS_AS(fixmath::mul(fixmath::FIX_MAX, fixmath::from_int(2)), std::overflow_error);
        REQUIRE_THROWS_AS(fixmath::div(fixmath::FIX_ONE, 0), std::domain_error);
        REQUIRE_THROWS_AS(fixmath::mulu_divu(fixmath::FIX_ONE, 1, 0), std::domain_error);
    }

    SECTION("Powers compose") {
        Fix growth = fixmath::pow(fixmath::from_string("1.01"), 2, Rounding::Ceil);
        REQUIRE(growth == fixmath::from_string("1.0201"));
        REQUIRE(fixmath::pow(fixmath::from_string("1.5"), 0) == fixmath::FIX_ONE);
    }

    SECTION("Absolute difference is symmetric") {
        Fix a = fixmath::from_string("0.98");
        REQUIRE(fixmath::abs_diff(a, fixmath::FIX_ONE) == fixmath::from_string("0.02"));
        REQUIRE(fixmath::abs_diff(fixmath::FIX_ONE, a) == fixmath::from_string("0.02"));
    }
}
