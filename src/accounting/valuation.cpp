#include "accounting/valuation.hpp"

namespace accounting {

const std::array<const char*, ReportRow::kFieldCount>& ReportRow::headers() {
    static const std::array<const char*, kFieldCount> names = {
        "asset", "quote", "total_bought", "avg_buy_price",
        "total_sold", "avg_sell_price", "net_from_history",
        "remaining_unsold_volume", "avg_buy_price_of_remaining",
        "fees_total", "realized_pnl", "current_price", "unrealized_pnl",
    };
    return names;
}

std::array<std::string, ReportRow::kFieldCount> ReportRow::fields() const {
    return {
        asset, quote, total_bought, avg_buy_price,
        total_sold, avg_sell_price, net_from_history,
        remaining_unsold_volume, avg_buy_price_of_remaining,
        fees_total, realized_pnl, current_price, unrealized_pnl,
    };
}

Decimal unrealized_pnl(const FifoLedger& ledger, const Decimal& current_price) {
    Decimal total{0};
    if (current_price <= 0 || ledger.remaining_inventory().volume <= 0) {
        return total;
    }
    for (const auto& lot : ledger.lots()) {
        total += (current_price - lot.unit_cost) * lot.remaining_volume;
    }
    return total;
}

ReportRow value_ledger(const PairKey& key, const FifoLedger& ledger, const PriceMap& prices) {
    const auto inventory = ledger.remaining_inventory();

    Decimal current_price{0};
    const auto price_it = prices.find(ledger.example_pair_identifier());
    if (price_it != prices.end()) {
        current_price = price_it->second;
    }

    ReportRow row;
    row.asset = key.base;
    row.quote = key.quote;
    row.total_bought = to_string(ledger.buy_volume());
    row.avg_buy_price = to_string(safe_div(ledger.buy_cost(), ledger.buy_volume()));
    row.total_sold = to_string(ledger.sell_volume());
    row.avg_sell_price = to_string(safe_div(ledger.sell_proceeds(), ledger.sell_volume()));
    row.net_from_history = to_string(Decimal(ledger.buy_volume() - ledger.sell_volume()));
    row.remaining_unsold_volume = to_string(inventory.volume);
    row.avg_buy_price_of_remaining = to_string(safe_div(inventory.cost, inventory.volume));
    row.fees_total = to_string(ledger.fees_total());
    row.realized_pnl = to_string(ledger.realized_pnl());
    row.current_price = to_string(current_price);
    row.unrealized_pnl = to_string(unrealized_pnl(ledger, current_price));
    return row;
}

std::vector<ReportRow> compute_report(const LedgerBook& book, const PriceMap& prices) {
    std::vector<ReportRow> rows;
    rows.reserve(book.size());
    for (const auto& [key, ledger] : book.ledgers()) {
        rows.push_back(value_ledger(key, ledger, prices));
    }
    return rows;
}

} // namespace accounting
