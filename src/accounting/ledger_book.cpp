#include "accounting/ledger_book.hpp"

#include <cctype>
#include <iostream>
#include <utility>

namespace accounting {
namespace {

std::string to_lower(std::string value) {
    for (auto& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::string trim(const std::string& value) {
    std::size_t first = 0;
    std::size_t last = value.size();
    while (first < last && std::isspace(static_cast<unsigned char>(value[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
        --last;
    }
    return value.substr(first, last - first);
}

bool is_blank(const nlohmann::json& value) {
    return value.is_null() || (value.is_string() && value.get<std::string>().empty());
}

// Absent, null and empty values leave out untouched and succeed.
bool read_decimal(const nlohmann::json& record, const char* key, std::optional<Decimal>& out, std::string& error) {
    if (!record.contains(key) || is_blank(record.at(key))) {
        return true;
    }
    auto value = decimal_from_json(record.at(key));
    if (!value) {
        error = std::string("invalid '") + key + "': " + record.at(key).dump();
        return false;
    }
    out = std::move(value);
    return true;
}

std::string read_string(const nlohmann::json& record, const char* key) {
    if (!record.contains(key) || !record.at(key).is_string()) {
        return {};
    }
    return record.at(key).get<std::string>();
}

TradeSide side_from_text(const std::string& text) {
    const auto lowered = to_lower(trim(text));
    if (lowered == "buy") {
        return TradeSide::Buy;
    }
    if (lowered == "sell") {
        return TradeSide::Sell;
    }
    return TradeSide::Other;
}

} // namespace

TradeParseResult parse_trade(const nlohmann::json& record) {
    TradeParseResult result;
    if (!record.is_object()) {
        result.error = "record is not an object";
        return result;
    }

    std::optional<Decimal> volume;
    std::optional<Decimal> price;
    std::optional<Decimal> cost;
    std::optional<Decimal> fee;
    std::optional<Decimal> time;
    if (!read_decimal(record, "vol", volume, result.error) ||
        !read_decimal(record, "price", price, result.error) ||
        !read_decimal(record, "cost", cost, result.error) ||
        !read_decimal(record, "fee", fee, result.error) ||
        !read_decimal(record, "time", time, result.error)) {
        return result;
    }

    Trade trade;
    trade.pair = trim(read_string(record, "pair"));
    trade.side = side_from_text(read_string(record, "type"));
    trade.volume = volume.value_or(Decimal(0));
    trade.price = price.value_or(Decimal(0));
    trade.cost = std::move(cost);
    trade.fee = fee.value_or(Decimal(0));
    trade.timestamp = time ? time->convert_to<double>() : 0.0;

    if (trade.volume < 0 || trade.price < 0 || trade.fee < 0 || (trade.cost && *trade.cost < 0)) {
        result.error = "negative volume, price, cost or fee";
        return result;
    }

    result.trade = std::move(trade);
    return result;
}

LedgerBook::LedgerBook(LedgerBookConfig config)
    : config_(std::move(config)) {}

ApplySummary LedgerBook::apply_all(const std::vector<nlohmann::json>& records) {
    ApplySummary total;
    for (const auto& record : records) {
        const auto parsed = parse_trade(record);
        if (!parsed.ok()) {
            ++total.malformed;
            std::cerr << "[Ledger] Skipping malformed trade record: " << parsed.error << std::endl;
            continue;
        }

        const auto summary = apply(*parsed.trade);
        total.applied += summary.applied;
        total.filtered += summary.filtered;
        total.ignored += summary.ignored;
        total.oversold += summary.oversold;
    }
    return total;
}

ApplySummary LedgerBook::apply(const Trade& trade) {
    ApplySummary summary;
    const auto key = parse_pair(trade.pair);
    if (!accepts_quote(key.quote)) {
        ++summary.filtered;
        return summary;
    }

    auto& ledger = ledgers_[key];
    ledger.observe(trade.pair, trade.timestamp);

    switch (trade.side) {
    case TradeSide::Buy:
        ledger.apply_buy(trade.volume, trade.price, trade.cost, trade.fee, config_.include_fees_in_cost);
        ++summary.applied;
        break;
    case TradeSide::Sell: {
        const Decimal unmatched =
            ledger.apply_sell(trade.volume, trade.price, trade.cost, trade.fee, config_.include_fees_in_cost);
        ++summary.applied;
        if (unmatched > 0) {
            ++summary.oversold;
            std::cerr << "[Ledger] " << key.display() << " sell exceeds open lots by "
                      << to_string(unmatched) << "; trade history may be incomplete" << std::endl;
        }
        break;
    }
    case TradeSide::Other:
        ++summary.ignored;
        break;
    }
    return summary;
}

AdjustmentStatus LedgerBook::adjust_remaining(const PairKey& key, const Decimal& target_volume) {
    if (target_volume < 0) {
        return AdjustmentStatus::InvalidTarget;
    }
    const auto it = ledgers_.find(key);
    if (it == ledgers_.end()) {
        return AdjustmentStatus::UnknownPair;
    }
    if (target_volume >= it->second.remaining_inventory().volume) {
        return AdjustmentStatus::Unchanged;
    }
    it->second.shrink_to_target(target_volume);
    return AdjustmentStatus::Applied;
}

const FifoLedger* LedgerBook::find(const PairKey& key) const {
    const auto it = ledgers_.find(key);
    return it == ledgers_.end() ? nullptr : &it->second;
}

std::set<std::string> LedgerBook::pair_identifiers() const {
    std::set<std::string> identifiers;
    for (const auto& [key, ledger] : ledgers_) {
        if (!ledger.example_pair_identifier().empty()) {
            identifiers.insert(ledger.example_pair_identifier());
        }
    }
    return identifiers;
}

bool LedgerBook::accepts_quote(const std::string& quote) const {
    if (!config_.quote_filter || config_.quote_filter->empty()) {
        return true;
    }
    return config_.quote_filter->count(quote) != 0;
}

} // namespace accounting
