#include "accounting/decimal.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using accounting::Decimal;
using accounting::parse_decimal;
using accounting::to_string;

TEST_CASE("parse_decimal keeps decimal text exact") {
    const auto a = parse_decimal("0.1");
    const auto b = parse_decimal("0.2");
    REQUIRE(a);
    REQUIRE(b);
    CHECK(Decimal(*a + *b) == *parse_decimal("0.3"));
    CHECK(to_string(*parse_decimal(" 12.50 ")) == "12.5");
    CHECK(to_string(*parse_decimal("-3")) == "-3");
    CHECK(to_string(*parse_decimal("+.5")) == "0.5");
    CHECK(to_string(*parse_decimal("1e3")) == "1000");
    CHECK(to_string(*parse_decimal("2.5E-2")) == "0.025");
}

TEST_CASE("parse_decimal rejects non-numeric text") {
    CHECK_FALSE(parse_decimal(""));
    CHECK_FALSE(parse_decimal("   "));
    CHECK_FALSE(parse_decimal("abc"));
    CHECK_FALSE(parse_decimal("1.2.3"));
    CHECK_FALSE(parse_decimal("."));
    CHECK_FALSE(parse_decimal("1e"));
    CHECK_FALSE(parse_decimal("NaN"));
    CHECK_FALSE(parse_decimal("Infinity"));
    CHECK_FALSE(parse_decimal("12 34"));
}

TEST_CASE("decimal_from_json accepts strings and numbers") {
    using accounting::decimal_from_json;
    CHECK(to_string(*decimal_from_json(nlohmann::json("9000.00000"))) == "9000");
    CHECK(to_string(*decimal_from_json(nlohmann::json(42))) == "42");
    CHECK(*decimal_from_json(nlohmann::json(0.1)) == *parse_decimal("0.1"));
    CHECK(to_string(*decimal_from_json(nlohmann::json(1616492376.5942))) == "1616492376.5942");
    CHECK_FALSE(decimal_from_json(nlohmann::json()));
    CHECK_FALSE(decimal_from_json(nlohmann::json(true)));
    CHECK_FALSE(decimal_from_json(nlohmann::json::array({1})));
    CHECK_FALSE(decimal_from_json(nlohmann::json("x1")));
}

TEST_CASE("safe_div returns zero for a zero denominator") {
    using accounting::safe_div;
    CHECK(safe_div(Decimal(5), Decimal(0)) == 0);
    CHECK(safe_div(Decimal(0), Decimal(0)) == 0);
    CHECK(to_string(safe_div(Decimal(9), Decimal(3))) == "3");
    CHECK(to_string(safe_div(*parse_decimal("3996"), *parse_decimal("0.4"))) == "9990");
}

TEST_CASE("to_string renders plain positional notation") {
    CHECK(to_string(Decimal(0)) == "0");
    CHECK(to_string(Decimal(-0)) == "0");
    CHECK(to_string(*parse_decimal("392.400")) == "392.4");
    CHECK(to_string(*parse_decimal("100")) == "100");
    CHECK(to_string(*parse_decimal("1.5e6")) == "1500000");
    CHECK(to_string(*parse_decimal("-98765432109876543210")) == "-98765432109876543210");
    CHECK(to_string(Decimal(1) / Decimal(3)) == "0." + std::string(accounting::kRenderScale, '3'));
}

TEST_CASE("to_string keeps sub-1e-20 magnitudes down to the render scale") {
    CHECK(to_string(*parse_decimal("0.000000000000000000001")) == "0.000000000000000000001");
    CHECK(to_string(*parse_decimal("-1e-21")) == "-0.000000000000000000001");
    CHECK(to_string(*parse_decimal("1e-30")) == "0." + std::string(29, '0') + "1");
    CHECK(to_string(*parse_decimal("4e-31")) == "0");
    CHECK(to_string(*parse_decimal("-4e-31")) == "0");
}

TEST_CASE("to_string hides division residue on a closed position") {
    // 3 units bought for 100 and sold for 100: the cost of the lot is
    // 3 * (100 / 3), which differs from 100 only far below the render scale.
    const Decimal unit_cost = accounting::safe_div(Decimal(100), Decimal(3));
    const Decimal realized = Decimal(100) - Decimal(3) * unit_cost;
    CHECK(to_string(realized) == "0");
    CHECK(to_string(Decimal(3) * unit_cost) == "100");
}
