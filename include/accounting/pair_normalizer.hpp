#pragma once

#include <string>
#include <tuple>

namespace accounting {

struct PairKey {
    std::string base;
    std::string quote;

    bool operator<(const PairKey& other) const {
        return std::tie(base, quote) < std::tie(other.base, other.quote);
    }
    bool operator==(const PairKey& other) const {
        return base == other.base && quote == other.quote;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }

    [[nodiscard]] std::string display() const { return base + "/" + quote; }
};

// Maps an exchange pair identifier ("XXBTZUSD", "ETH/USDT", "ETHUSD") to
// (base, quote). Without a legacy 'Z' split, a known quote suffix is tried,
// then a trailing 4- or 3-character quote; an empty base or quote marks a
// suspect key.
PairKey parse_pair(const std::string& identifier);

} // namespace accounting
