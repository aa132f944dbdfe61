#include "accounting/pair_normalizer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace accounting {
namespace {

constexpr char kSeparator = '/';
constexpr char kLegacyQuoteMarker = 'Z';
constexpr char kLegacyBasePrefix = 'X';
constexpr std::size_t kMinLegacyLength = 7;

const std::array<std::pair<const char*, const char*>, 2> kAssetAliases = {{
    {"XBT", "BTC"},
    {"XDG", "DOGE"},
}};

// Checked longest first when an identifier carries no legacy marker.
const std::array<const char*, 12> kKnownQuotes = {
    "USDT", "USDC", "DAI", "USD", "EUR", "GBP", "CAD", "JPY", "CHF", "AUD", "BTC", "ETH",
};

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string replace_all(std::string value, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
    return value;
}

std::string normalize(const std::string& identifier) {
    std::string out;
    out.reserve(identifier.size());
    for (unsigned char c : identifier) {
        if (c == kSeparator || std::isspace(c)) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    for (const auto& [legacy, canonical] : kAssetAliases) {
        out = replace_all(std::move(out), legacy, canonical);
    }
    return out;
}

} // namespace

PairKey parse_pair(const std::string& identifier) {
    const auto normalized = normalize(identifier);
    if (normalized.empty()) {
        return {};
    }

    if (normalized.size() >= kMinLegacyLength) {
        const auto marker = normalized.rfind(kLegacyQuoteMarker);
        if (marker != std::string::npos) {
            std::string left = normalized.substr(0, marker);
            std::string right = normalized.substr(marker + 1);
            if (!left.empty() && right.size() >= 3 && right.size() <= 4) {
                if (left.size() >= 2 && left.front() == kLegacyBasePrefix) {
                    left.erase(0, 1);
                }
                return {std::move(left), std::move(right)};
            }
        }
    }

    for (const char* quote : kKnownQuotes) {
        const std::string suffix(quote);
        if (normalized.size() > suffix.size() && ends_with(normalized, suffix)) {
            return {normalized.substr(0, normalized.size() - suffix.size()), suffix};
        }
    }

    for (const std::size_t quote_length : {std::size_t{4}, std::size_t{3}}) {
        if (normalized.size() > quote_length) {
            const auto split = normalized.size() - quote_length;
            return {normalized.substr(0, split), normalized.substr(split)};
        }
    }
    return {normalized, ""};
}

} // namespace accounting
