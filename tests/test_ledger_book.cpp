#include "accounting/ledger_book.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <set>
#include <string>
#include <vector>

using accounting::AdjustmentStatus;
using accounting::Decimal;
using accounting::LedgerBook;
using accounting::LedgerBookConfig;
using accounting::PairKey;
using accounting::TradeSide;
using accounting::to_string;

namespace {

nlohmann::json trade(const char* pair, const char* type, const char* vol, const char* price,
                     const char* fee = "0", double time = 0.0) {
    return nlohmann::json{
        {"pair", pair},
        {"type", type},
        {"vol", vol},
        {"price", price},
        {"fee", fee},
        {"time", time},
    };
}

} // namespace

TEST_CASE("parse_trade reads a full exchange record") {
    const auto record = nlohmann::json::parse(R"({
        "ordertxid": "OQCLML-BW3P3-BUCMWZ",
        "pair": " XXBTZUSD ",
        "time": 1616667796.8802,
        "type": "Buy",
        "ordertype": "limit",
        "price": "30010.00000",
        "cost": "600.20000",
        "fee": "0.00000",
        "vol": "0.02000000"
    })");

    const auto parsed = accounting::parse_trade(record);
    REQUIRE(parsed.ok());
    const auto& t = *parsed.trade;
    CHECK(t.pair == "XXBTZUSD");
    CHECK(t.side == TradeSide::Buy);
    CHECK(to_string(t.volume) == "0.02");
    CHECK(to_string(t.price) == "30010");
    REQUIRE(t.cost);
    CHECK(to_string(*t.cost) == "600.2");
    CHECK(t.fee == 0);
    CHECK(std::abs(t.timestamp - 1616667796.8802) < 1e-6);
}

TEST_CASE("parse_trade defaults missing fields") {
    const auto parsed = accounting::parse_trade(nlohmann::json{{"pair", "ETHUSD"}, {"type", "sell"}, {"vol", ""}});
    REQUIRE(parsed.ok());
    CHECK(parsed.trade->side == TradeSide::Sell);
    CHECK(parsed.trade->volume == 0);
    CHECK(parsed.trade->price == 0);
    CHECK_FALSE(parsed.trade->cost);
    CHECK(parsed.trade->fee == 0);
    CHECK(parsed.trade->timestamp == 0.0);

    const auto unknown = accounting::parse_trade(nlohmann::json{{"pair", "ETHUSD"}, {"type", "margin"}});
    REQUIRE(unknown.ok());
    CHECK(unknown.trade->side == TradeSide::Other);
}

TEST_CASE("parse_trade reports malformed records") {
    CHECK_FALSE(accounting::parse_trade(nlohmann::json::array()).ok());
    CHECK_FALSE(accounting::parse_trade(nlohmann::json("trade")).ok());

    const auto bad_volume = accounting::parse_trade(trade("ETHUSD", "buy", "abc", "10"));
    CHECK_FALSE(bad_volume.ok());
    CHECK(bad_volume.error.find("vol") != std::string::npos);

    CHECK_FALSE(accounting::parse_trade(trade("ETHUSD", "buy", "1", "-10")).ok());
    CHECK_FALSE(accounting::parse_trade(trade("ETHUSD", "buy", "-1", "10")).ok());
    CHECK_FALSE(accounting::parse_trade(nlohmann::json{{"pair", "ETHUSD"}, {"type", "buy"}, {"time", "later"}}).ok());
    CHECK_FALSE(accounting::parse_trade(nlohmann::json{{"pair", "ETHUSD"}, {"type", "buy"}, {"fee", {1, 2}}}).ok());
}

TEST_CASE("apply_all routes trades to one ledger per pair") {
    LedgerBook book;
    const std::vector<nlohmann::json> records = {
        trade("XXBTZUSD", "buy", "1", "100", "0", 10.0),
        trade("XETHZUSD", "buy", "2", "50", "0", 11.0),
        trade("XBT/USD", "sell", "0.5", "120", "0", 12.0),
    };

    const auto summary = book.apply_all(records);
    CHECK(summary.applied == 3);
    CHECK(summary.malformed == 0);
    REQUIRE(book.size() == 2);

    const auto* btc = book.find(PairKey{"BTC", "USD"});
    REQUIRE(btc != nullptr);
    CHECK(to_string(btc->buy_volume()) == "1");
    CHECK(to_string(btc->sell_volume()) == "0.5");
    CHECK(to_string(btc->realized_pnl()) == "10");
    CHECK(btc->example_pair_identifier() == "XXBTZUSD");
    CHECK(btc->last_seen_timestamp() == 12.0);

    const auto* eth = book.find(PairKey{"ETH", "USD"});
    REQUIRE(eth != nullptr);
    CHECK(to_string(eth->remaining_inventory().volume) == "2");
    CHECK(book.find(PairKey{"SOL", "USD"}) == nullptr);

    const auto identifiers = book.pair_identifiers();
    CHECK(identifiers.size() == 2);
    CHECK(identifiers.count("XXBTZUSD") == 1);
    CHECK(identifiers.count("XETHZUSD") == 1);
}

TEST_CASE("apply_all skips malformed records and continues") {
    LedgerBook book;
    const std::vector<nlohmann::json> records = {
        trade("ETHUSD", "buy", "1", "100"),
        trade("ETHUSD", "buy", "lots", "100"),
        nlohmann::json("garbage"),
        trade("ETHUSD", "sell", "1", "110"),
    };

    const auto summary = book.apply_all(records);
    CHECK(summary.applied == 2);
    CHECK(summary.malformed == 2);
    const auto* ledger = book.find(PairKey{"ETH", "USD"});
    REQUIRE(ledger != nullptr);
    CHECK(to_string(ledger->realized_pnl()) == "10");
}

TEST_CASE("side matching ignores case and unknown sides only observe") {
    LedgerBook book;
    const auto summary = book.apply_all({
        trade("ETHUSD", "BUY", "1", "100"),
        trade("SOLUSD", "transfer", "5", "20", "0", 42.0),
    });

    CHECK(summary.applied == 1);
    CHECK(summary.ignored == 1);
    CHECK(to_string(book.find(PairKey{"ETH", "USD"})->buy_volume()) == "1");

    const auto* sol = book.find(PairKey{"SOL", "USD"});
    REQUIRE(sol != nullptr);
    CHECK(sol->buy_volume() == 0);
    CHECK(sol->lots().empty());
    CHECK(sol->last_seen_timestamp() == 42.0);
}

TEST_CASE("the quote allow-list drops other quotes entirely") {
    LedgerBookConfig config;
    config.quote_filter = std::set<std::string>{"USD"};
    LedgerBook book{config};

    const auto summary = book.apply_all({
        trade("XXBTZUSD", "buy", "1", "100"),
        trade("XXBTZEUR", "buy", "1", "90"),
        trade("ETHUSDT", "buy", "1", "10"),
    });

    CHECK(summary.applied == 1);
    CHECK(summary.filtered == 2);
    CHECK(book.size() == 1);
    CHECK(book.find(PairKey{"BTC", "EUR"}) == nullptr);
}

TEST_CASE("an empty allow-list keeps every quote") {
    LedgerBookConfig config;
    config.quote_filter = std::set<std::string>{};
    LedgerBook book{config};
    book.apply_all({trade("XXBTZEUR", "buy", "1", "90")});
    CHECK(book.size() == 1);
}

TEST_CASE("the fee policy comes from the book configuration") {
    LedgerBookConfig config;
    config.include_fees_in_cost = false;
    LedgerBook book{config};
    book.apply_all({trade("ETHUSD", "buy", "1", "100", "1")});

    const auto* ledger = book.find(PairKey{"ETH", "USD"});
    REQUIRE(ledger != nullptr);
    CHECK(to_string(ledger->buy_cost()) == "100");
    CHECK(to_string(ledger->fees_total()) == "1");
}

TEST_CASE("oversold sells are counted") {
    LedgerBook book;
    const auto summary = book.apply_all({
        trade("ETHUSD", "buy", "1", "100"),
        trade("ETHUSD", "sell", "2", "100"),
    });
    CHECK(summary.applied == 2);
    CHECK(summary.oversold == 1);
}

TEST_CASE("adjust_remaining validates before touching a ledger") {
    LedgerBook book;
    book.apply_all({
        trade("ETHUSD", "buy", "2", "100"),
        trade("ETHUSD", "buy", "1", "200"),
    });
    const PairKey eth{"ETH", "USD"};

    CHECK(book.adjust_remaining(eth, Decimal(-1)) == AdjustmentStatus::InvalidTarget);
    CHECK(to_string(book.find(eth)->remaining_inventory().volume) == "3");

    CHECK(book.adjust_remaining(PairKey{"BTC", "USD"}, Decimal(0)) == AdjustmentStatus::UnknownPair);
    CHECK(book.adjust_remaining(eth, Decimal(3)) == AdjustmentStatus::Unchanged);
    CHECK(book.adjust_remaining(eth, Decimal(5)) == AdjustmentStatus::Unchanged);

    CHECK(book.adjust_remaining(eth, Decimal(1)) == AdjustmentStatus::Applied);
    const auto* ledger = book.find(eth);
    REQUIRE(ledger->lots().size() == 1);
    CHECK(to_string(ledger->lots().front().unit_cost) == "200");
    CHECK(ledger->realized_pnl() == 0);
    CHECK(ledger->sell_volume() == 0);
}
