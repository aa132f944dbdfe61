#pragma once

#include "accounting/valuation.hpp"
#include "kraken/rest_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace accounting {

struct TradePage {
    std::vector<nlohmann::json> trades;
    long long count = 0;   // total trades available across all pages
};

// Extracts result.trades (keyed by transaction id) and result.count from one
// TradesHistory response. Throws kraken::KrakenApiError if the response
// carries errors.
TradePage parse_trade_page(const nlohmann::json& response);

// Stable sort by the numeric "time" field, oldest first; records without a
// readable time keep their relative order at the front.
void sort_chronologically(std::vector<nlohmann::json>& records);

// Lower bound on the pause between two TradesHistory pages.
constexpr std::chrono::milliseconds kMinTradePageInterval{800};

// Raw TradesHistory response for the page starting at the given offset.
using TradePageFetcher = std::function<nlohmann::json(long long offset)>;
using PagePause = std::function<void(std::chrono::milliseconds)>;

// Pages from offset 0 until the reported count is reached or a page comes
// back empty, pausing max(request_sleep, kMinTradePageInterval) between
// pages. The result is in chronological order. An empty pause sleeps the
// calling thread.
std::vector<nlohmann::json> fetch_trade_history(const TradePageFetcher& fetch_page,
                                                std::chrono::milliseconds request_sleep,
                                                const PagePause& pause = {});

std::vector<nlohmann::json> fetch_trade_history(const kraken::RestClient& client,
                                                std::chrono::milliseconds request_sleep);

// Last trade price (c[0]) or bid/ask midpoint per pair in a Ticker response.
// Entries without a usable price are left out.
PriceMap prices_from_ticker(const nlohmann::json& response, bool use_midprice);

// An API error yields an empty map; prices are optional for the report.
PriceMap fetch_current_prices(const kraken::RestClient& client,
                              const std::set<std::string>& pairs,
                              bool use_midprice);

} // namespace accounting
