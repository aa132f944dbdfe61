#pragma once

#include "accounting/decimal.hpp"
#include "accounting/ledger_book.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace accounting {

// Current price keyed by the raw pair identifier seen in trade records.
using PriceMap = std::map<std::string, Decimal>;

// Read-only snapshot for one (base, quote); numeric fields are decimal text.
// A current_price of "0" means no price was available.
struct ReportRow {
    std::string asset;
    std::string quote;
    std::string total_bought;
    std::string avg_buy_price;
    std::string total_sold;
    std::string avg_sell_price;
    std::string net_from_history;
    std::string remaining_unsold_volume;
    std::string avg_buy_price_of_remaining;
    std::string fees_total;
    std::string realized_pnl;
    std::string current_price;
    std::string unrealized_pnl;

    static constexpr std::size_t kFieldCount = 13;

    static const std::array<const char*, kFieldCount>& headers();
    [[nodiscard]] std::array<std::string, kFieldCount> fields() const;
};

// Sum over open lots of (current_price - unit_cost) * remaining_volume,
// or 0 when there is no price or no inventory.
Decimal unrealized_pnl(const FifoLedger& ledger, const Decimal& current_price);

ReportRow value_ledger(const PairKey& key, const FifoLedger& ledger, const PriceMap& prices);

// One row per ledger, ordered by (base, quote).
std::vector<ReportRow> compute_report(const LedgerBook& book, const PriceMap& prices);

} // namespace accounting
