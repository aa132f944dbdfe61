#include "accounting/fifo_ledger.hpp"

#include <algorithm>
#include <stdexcept>

namespace accounting {

void FifoLedger::apply_buy(const Decimal& volume,
                           const Decimal& price,
                           const std::optional<Decimal>& cost,
                           const Decimal& fee,
                           bool include_fee_in_cost) {
    const Decimal gross = cost ? *cost : Decimal(volume * price);
    const Decimal buy_cost = gross + (include_fee_in_cost ? fee : Decimal(0));

    buy_volume_ += volume;
    buy_cost_ += buy_cost;
    fees_total_ += fee;

    const Decimal unit_cost = volume > 0 ? safe_div(buy_cost, volume) : Decimal(0);
    lots_.push_back(Lot{volume, unit_cost, volume * unit_cost});
}

Decimal FifoLedger::apply_sell(const Decimal& volume,
                               const Decimal& price,
                               const std::optional<Decimal>& cost,
                               const Decimal& fee,
                               bool include_fee_in_cost) {
    const Decimal gross = cost ? *cost : Decimal(volume * price);
    const Decimal proceeds = gross - (include_fee_in_cost ? fee : Decimal(0));

    sell_volume_ += volume;
    sell_proceeds_ += proceeds;
    fees_total_ += fee;

    const Decimal per_unit_proceeds = volume > 0 ? safe_div(proceeds, volume) : Decimal(0);
    const auto consumption = consume_from_head(volume, per_unit_proceeds);
    realized_pnl_ += consumption.realized;

    const Decimal unmatched = volume - consumption.matched_volume;
    if (unmatched > 0) {
        unmatched_sell_volume_ += unmatched;
    }
    return unmatched;
}

Inventory FifoLedger::remaining_inventory() const {
    Inventory inventory{Decimal(0), Decimal(0)};
    for (const auto& lot : lots_) {
        inventory.volume += lot.remaining_volume;
        inventory.cost += lot.total_cost;
    }
    return inventory;
}

void FifoLedger::shrink_to_target(const Decimal& target_volume) {
    if (target_volume < 0) {
        throw std::invalid_argument("shrink target must not be negative");
    }

    const Decimal current = remaining_inventory().volume;
    if (target_volume >= current) {
        return;
    }

    const auto consumption = consume_from_head(current - target_volume, Decimal(0));
    shrunk_volume_ += consumption.matched_volume;
}

void FifoLedger::observe(const std::string& pair_identifier, double timestamp) {
    last_seen_timestamp_ = std::max(last_seen_timestamp_, timestamp);
    if (example_pair_identifier_.empty()) {
        example_pair_identifier_ = pair_identifier;
    }
}

FifoLedger::Consumption FifoLedger::consume_from_head(Decimal volume, const Decimal& per_unit_proceeds) {
    Consumption consumption;
    while (volume > 0 && !lots_.empty()) {
        Lot& lot = lots_.front();
        const Decimal use = std::min(lot.remaining_volume, volume);

        consumption.realized += use * per_unit_proceeds - use * lot.unit_cost;
        consumption.matched_volume += use;
        volume -= use;

        lot.remaining_volume -= use;
        if (lot.remaining_volume <= 0) {
            lots_.pop_front();
        } else {
            lot.total_cost = lot.remaining_volume * lot.unit_cost;
        }
    }
    return consumption;
}

} // namespace accounting
