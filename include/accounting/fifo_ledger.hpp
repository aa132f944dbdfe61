#pragma once

#include "accounting/decimal.hpp"

#include <deque>
#include <optional>
#include <string>

namespace accounting {

struct Lot {
    Decimal remaining_volume;
    Decimal unit_cost;
    Decimal total_cost;   // always remaining_volume * unit_cost
};

struct Inventory {
    Decimal volume;
    Decimal cost;
};

// Per-pair FIFO lot accounting. Buys append lots at the tail; sells and
// external shrinks consume from the head, splitting the oldest lot first.
class FifoLedger {
public:
    FifoLedger() = default;

    // cost defaults to volume * price when not supplied.
    void apply_buy(const Decimal& volume,
                   const Decimal& price,
                   const std::optional<Decimal>& cost,
                   const Decimal& fee,
                   bool include_fee_in_cost);

    // Returns the volume that found no open lot to match against.
    Decimal apply_sell(const Decimal& volume,
                       const Decimal& price,
                       const std::optional<Decimal>& cost,
                       const Decimal& fee,
                       bool include_fee_in_cost);

    [[nodiscard]] Inventory remaining_inventory() const;

    // Removes inventory down to target_volume without touching sell totals,
    // fees or realized PnL. Never adds inventory. Throws on a negative target.
    void shrink_to_target(const Decimal& target_volume);

    void observe(const std::string& pair_identifier, double timestamp);

    const Decimal& buy_volume() const { return buy_volume_; }
    const Decimal& buy_cost() const { return buy_cost_; }
    const Decimal& sell_volume() const { return sell_volume_; }
    const Decimal& sell_proceeds() const { return sell_proceeds_; }
    const Decimal& fees_total() const { return fees_total_; }
    const Decimal& realized_pnl() const { return realized_pnl_; }
    const Decimal& shrunk_volume() const { return shrunk_volume_; }
    const Decimal& unmatched_sell_volume() const { return unmatched_sell_volume_; }
    const std::deque<Lot>& lots() const { return lots_; }
    double last_seen_timestamp() const { return last_seen_timestamp_; }
    const std::string& example_pair_identifier() const { return example_pair_identifier_; }

private:
    struct Consumption {
        Decimal matched_volume{0};
        Decimal realized{0};
    };

    // Head-first lot consumption shared by sells and shrinks.
    Consumption consume_from_head(Decimal volume, const Decimal& per_unit_proceeds);

    Decimal buy_volume_{0};
    Decimal buy_cost_{0};
    Decimal sell_volume_{0};
    Decimal sell_proceeds_{0};
    Decimal fees_total_{0};
    Decimal realized_pnl_{0};
    Decimal shrunk_volume_{0};
    Decimal unmatched_sell_volume_{0};
    std::deque<Lot> lots_;
    double last_seen_timestamp_ = 0.0;
    std::string example_pair_identifier_;
};

} // namespace accounting
