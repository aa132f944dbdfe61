#pragma once

#include "accounting/decimal.hpp"
#include "accounting/fifo_ledger.hpp"
#include "accounting/pair_normalizer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace accounting {

enum class TradeSide { Buy, Sell, Other };

struct Trade {
    std::string pair;
    TradeSide side = TradeSide::Other;
    Decimal volume{0};
    Decimal price{0};
    std::optional<Decimal> cost;   // volume * price when absent
    Decimal fee{0};
    double timestamp = 0.0;        // seconds
};

struct TradeParseResult {
    std::optional<Trade> trade;
    std::string error;

    [[nodiscard]] bool ok() const { return trade.has_value(); }
};

// Reads one exchange trade object ({"pair", "type", "vol", "price", "cost",
// "fee", "time"}). Missing fields take their defaults; present but invalid
// or negative values make the record malformed.
TradeParseResult parse_trade(const nlohmann::json& record);

struct LedgerBookConfig {
    bool include_fees_in_cost = true;
    // Empty or unset means every quote currency is kept.
    std::optional<std::set<std::string>> quote_filter;
};

struct ApplySummary {
    std::size_t applied = 0;
    std::size_t malformed = 0;
    std::size_t filtered = 0;
    std::size_t ignored = 0;    // recognised pair, unknown side
    std::size_t oversold = 0;   // sells that ran past the open lots
};

enum class AdjustmentStatus { Applied, Unchanged, InvalidTarget, UnknownPair };

class LedgerBook {
public:
    using LedgerMap = std::map<PairKey, FifoLedger>;

    explicit LedgerBook(LedgerBookConfig config = {});

    // Records are folded in the order given; buys must precede the sells
    // they cover for FIFO matching to be meaningful.
    ApplySummary apply_all(const std::vector<nlohmann::json>& records);

    ApplySummary apply(const Trade& trade);

    AdjustmentStatus adjust_remaining(const PairKey& key, const Decimal& target_volume);

    const FifoLedger* find(const PairKey& key) const;

    [[nodiscard]] std::set<std::string> pair_identifiers() const;

    const LedgerMap& ledgers() const { return ledgers_; }
    const LedgerBookConfig& config() const { return config_; }
    [[nodiscard]] bool empty() const { return ledgers_.empty(); }
    [[nodiscard]] std::size_t size() const { return ledgers_.size(); }

private:
    bool accepts_quote(const std::string& quote) const;

    LedgerBookConfig config_;
    LedgerMap ledgers_;
};

} // namespace accounting
