#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace accounting {

// Base-10 digits: decimal text converts without binary rounding.
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Fractional digits kept when a value is rendered as text. Exchange volumes
// and prices carry at most 10 decimals, so anything below 1e-30 is division
// residue and renders as 0.
constexpr int kRenderScale = 30;

std::optional<Decimal> parse_decimal(const std::string& text);

std::optional<Decimal> decimal_from_json(const nlohmann::json& value);

// Zero denominators yield 0 ("no volume yet"), never an exception.
Decimal safe_div(const Decimal& numerator, const Decimal& denominator);

// Plain positional notation, no exponent, trailing zeros removed.
std::string to_string(const Decimal& value);

} // namespace accounting
