#include "accounting/decimal.hpp"

#include <cctype>
#include <ios>
#include <stdexcept>

namespace accounting {
namespace {

bool is_decimal_literal(const std::string& text) {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }

    std::size_t digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
        ++digits;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        std::size_t exponent_digits = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            ++exponent_digits;
        }
        if (exponent_digits == 0 || exponent_digits > 6) {
            return false;
        }
    }
    return i == text.size();
}

std::string strip(const std::string& text) {
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

} // namespace

std::optional<Decimal> parse_decimal(const std::string& text) {
    const auto literal = strip(text);
    if (!is_decimal_literal(literal)) {
        return std::nullopt;
    }
    try {
        return Decimal(literal.c_str());
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

std::optional<Decimal> decimal_from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return parse_decimal(value.get<std::string>());
    }
    if (value.is_number()) {
        // dump() yields the shortest round-trip text, so 0.1 stays 0.1.
        return parse_decimal(value.dump());
    }
    return std::nullopt;
}

Decimal safe_div(const Decimal& numerator, const Decimal& denominator) {
    if (denominator == 0) {
        return Decimal(0);
    }
    return numerator / denominator;
}

std::string to_string(const Decimal& value) {
    std::string text = value.str(kRenderScale, std::ios_base::fixed);

    const auto point = text.find('.');
    if (point != std::string::npos) {
        std::size_t end = text.find_last_not_of('0');
        if (end == point) {
            --end;
        }
        text.erase(end + 1);
    }

    if (text == "-0") {
        return "0";
    }
    return text;
}

} // namespace accounting
