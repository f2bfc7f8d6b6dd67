#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "number.h"
#include "DecimalConstants.h"

using num::DefaultNumber;
using namespace Catch;

TEST_CASE("toString produces the expected string representation", "[number]") {
    DefaultNumber d = createDecimal("12.345");
    REQUIRE(num::toString(d) == std::string("12.3450000"));
}

TEST_CASE("abs returns the absolute value for both price types", "[number]") {
    DefaultNumber neg = createDecimal("-5.5");
    DefaultNumber pos = createDecimal("5.5");
    REQUIRE(num::abs(neg) == pos);
    REQUIRE(num::abs(pos) == pos);

    REQUIRE(num::abs(-2.25) == 2.25);
}

TEST_CASE("to_double and fromDouble convert between price and double", "[number]") {
    DefaultNumber d = createDecimal("1.234");
    REQUIRE(num::to_double(d) == Approx(1.234));
    REQUIRE(num::fromDouble<DefaultNumber>(105.25) == createDecimal("105.25"));
    REQUIRE(num::to_double(3.5) == 3.5);
}

TEST_CASE("fromString parses decimal strings", "[number]") {
    REQUIRE(num::fromString<DefaultNumber>("42.5") == createDecimal("42.5"));
    REQUIRE(num::fromString<double>("42.5") == Approx(42.5));
}

TEST_CASE("DecimalConstants hold the classifier thresholds", "[DecimalConstants]") {
    using chartsieve::DecimalConstants;

    REQUIRE(DecimalConstants<DefaultNumber>::DecimalZero == createDecimal("0"));
    REQUIRE(DecimalConstants<DefaultNumber>::DecimalOneHundred == createDecimal("100"));
    REQUIRE(DecimalConstants<DefaultNumber>::TwentyFivePercent == createDecimal("25"));
    REQUIRE(DecimalConstants<DefaultNumber>::FiftyPercent == createDecimal("50"));
    REQUIRE(DecimalConstants<DefaultNumber>::SeventyFivePercent == createDecimal("75"));
    REQUIRE(DecimalConstants<double>::SeventyFivePercent == Approx(75.0));
}
