// Bondcurve - Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <bondcurve/types.hpp>
#include <bondcurve/error.hpp>

#include <limits>
#include <string>

using namespace bondcurve;
using Catch::Approx;

TEST_CASE("Fixed construction", "[types]") {
    SECTION("From integer") {
        REQUIRE((Fixed::from_int(5).raw() == 5 * X18_ONE));
        REQUIRE((Fixed::from_int(-3).raw() == -3 * X18_ONE));
        REQUIRE(Fixed::from_int(0).is_zero());
    }

    SECTION("From string") {
        REQUIRE((Fixed::from_string("123.456").raw() == static_cast<I128>(123456) * 1000000000000000LL));
        REQUIRE(Fixed::from_string("-12.5") == -Fixed::from_string("12.5"));
        REQUIRE(Fixed::from_string("+7") == Fixed::from_int(7));
        REQUIRE(Fixed::from_string("0.000000000000000001") == Fixed::epsilon());
        REQUIRE(Fixed::from_string(".5") == Fixed::half());
        REQUIRE(Fixed::from_string("2.") == Fixed::from_int(2));
    }

    SECTION("Digits past 18 decimals are truncated") {
        REQUIRE(Fixed::from_string("1.1234567890123456789") ==
                Fixed::from_string("1.123456789012345678"));
    }

    SECTION("Malformed strings") {
        REQUIRE_THROWS_AS(Fixed::from_string(""), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string("-"), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string("."), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string("abc"), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string("1.2.3"), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string("1e5"), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_string(" 1"), InvalidInput);
    }

    SECTION("String out of range") {
        REQUIRE_THROWS_AS(Fixed::from_string("1000000000000000000000000"), InvalidInput);
    }

    SECTION("From double") {
        REQUIRE(Fixed::from_double(0.5) == Fixed::half());
        REQUIRE(Fixed::from_double(-2.0) == Fixed::from_int(-2));
        REQUIRE(Fixed::from_double(1.25).to_double() == Approx(1.25));
    }

    SECTION("Non-finite or oversized doubles are rejected") {
        REQUIRE_THROWS_AS(Fixed::from_double(std::numeric_limits<double>::quiet_NaN()), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_double(std::numeric_limits<double>::infinity()), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_double(-std::numeric_limits<double>::infinity()), InvalidInput);
        REQUIRE_THROWS_AS(Fixed::from_double(1e30), InvalidInput);
    }

    SECTION("Constants") {
        REQUIRE(Fixed::zero().is_zero());
        REQUIRE((Fixed::one().raw() == X18_ONE));
        REQUIRE((Fixed::half().raw() == X18_HALF));
        REQUIRE((Fixed::epsilon().raw() == 1));
        REQUIRE(Fixed::min() == -Fixed::max());
    }

    SECTION("Raw values keep negation defined") {
        REQUIRE(Fixed::from_raw(I128_MIN) == Fixed::min());
        REQUIRE(-Fixed::from_raw(I128_MIN) == Fixed::max());
        REQUIRE_THROWS_AS(Fixed::from_raw(I128_MIN - 1), InvalidInput);
    }
}

TEST_CASE("Fixed formatting", "[types]") {
    REQUIRE(Fixed::from_int(50).to_string() == "50");
    REQUIRE(Fixed::from_string("-12.5").to_string() == "-12.5");
    REQUIRE(Fixed::from_string("0.000001").to_string() == "0.000001");
    REQUIRE(Fixed::epsilon().to_string() == "0.000000000000000001");
    REQUIRE(Fixed::zero().to_string() == "0");
    REQUIRE(Fixed::from_string("41.250000").to_string() == "41.25");
}

TEST_CASE("Fixed arithmetic", "[types]") {
    SECTION("Basic operations") {
        Fixed a = Fixed::from_string("100.5");
        Fixed b = Fixed::from_string("50.25");

        REQUIRE(a + b == Fixed::from_string("150.75"));
        REQUIRE(a - b == Fixed::from_string("50.25"));
        REQUIRE(a * Fixed::from_int(2) == Fixed::from_int(201));
        REQUIRE(a / Fixed::from_int(2) == Fixed::from_string("50.25"));
    }

    SECTION("Division truncates toward zero") {
        REQUIRE(((Fixed::one() / Fixed::from_int(3)).raw() == 333333333333333333LL));
        REQUIRE(((-Fixed::one() / Fixed::from_int(3)).raw() == -333333333333333333LL));
        REQUIRE(Fixed::epsilon() * Fixed::epsilon() == Fixed::zero());
    }

    SECTION("Compound assignment") {
        Fixed x = Fixed::from_int(10);
        x += Fixed::from_int(5);
        x -= Fixed::from_int(3);
        x *= Fixed::from_int(2);
        x /= Fixed::from_int(4);
        REQUIRE(x == Fixed::from_int(6));
    }

    SECTION("Overflow and division by zero throw") {
        REQUIRE_THROWS_AS(Fixed::max() + Fixed::one(), CalculationError);
        REQUIRE_THROWS_AS(Fixed::min() - Fixed::one(), CalculationError);
        REQUIRE_THROWS_AS(Fixed::max() * Fixed::from_int(2), CalculationError);
        REQUIRE_THROWS_AS(Fixed::one() / Fixed::zero(), CalculationError);
    }

    SECTION("Comparison") {
        Fixed a = Fixed::from_int(10);
        Fixed b = Fixed::from_int(20);

        REQUIRE(a < b);
        REQUIRE(b > a);
        REQUIRE(a <= a);
        REQUIRE(a >= a);
        REQUIRE(a == a);
        REQUIRE(a != b);
    }

    SECTION("Predicates") {
        REQUIRE(Fixed::from_int(3).is_integer());
        REQUIRE_FALSE(Fixed::from_string("3.5").is_integer());
        REQUIRE(Fixed::from_int(-1).is_negative());
        REQUIRE(Fixed::one().is_positive());
    }
}

TEST_CASE("Error taxonomy", "[types]") {
    SECTION("Message carries the kind") {
        InvalidInput e("Slope must be positive");
        REQUIRE(std::string(e.what()) == "Invalid input: Slope must be positive");
        REQUIRE(e.kind() == ErrorKind::InvalidInput);
        REQUIRE(e.detail() == "Slope must be positive");

        CalculationError c("Division by zero");
        REQUIRE(std::string(c.what()) == "Calculation error: Division by zero");
        REQUIRE(c.kind() == ErrorKind::CalculationError);
    }

    SECTION("Both kinds are caught through the base") {
        REQUIRE_THROWS_AS(Fixed::one() / Fixed::zero(), BondingCurveError);
        REQUIRE_THROWS_AS(Fixed::from_string("x"), BondingCurveError);
        REQUIRE_THROWS_AS(Fixed::from_string("x"), std::runtime_error);
    }
}
