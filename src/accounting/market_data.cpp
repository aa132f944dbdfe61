#include "accounting/market_data.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace accounting {
namespace {

std::optional<Decimal> first_element(const nlohmann::json& entry, const char* key) {
    if (!entry.is_object() || !entry.contains(key)) {
        return std::nullopt;
    }
    const auto& value = entry.at(key);
    if (!value.is_array() || value.empty()) {
        return std::nullopt;
    }
    return decimal_from_json(value.front());
}

double record_time(const nlohmann::json& record) {
    if (!record.is_object() || !record.contains("time")) {
        return 0.0;
    }
    const auto value = decimal_from_json(record.at("time"));
    return value ? value->convert_to<double>() : 0.0;
}

} // namespace

TradePage parse_trade_page(const nlohmann::json& response) {
    const auto errors = kraken::response_errors(response);
    if (!errors.empty()) {
        throw kraken::KrakenApiError("TradesHistory error: " + kraken::join_errors(errors), errors);
    }

    TradePage page;
    if (!response.contains("result") || !response.at("result").is_object()) {
        return page;
    }
    const auto& result = response.at("result");
    if (result.contains("trades") && result.at("trades").is_object()) {
        for (const auto& [txid, trade] : result.at("trades").items()) {
            (void)txid;
            page.trades.push_back(trade);
        }
    }
    if (result.contains("count") && result.at("count").is_number_integer()) {
        page.count = result.at("count").get<long long>();
    }
    return page;
}

void sort_chronologically(std::vector<nlohmann::json>& records) {
    std::stable_sort(records.begin(), records.end(), [](const nlohmann::json& lhs, const nlohmann::json& rhs) {
        return record_time(lhs) < record_time(rhs);
    });
}

std::vector<nlohmann::json> fetch_trade_history(const TradePageFetcher& fetch_page,
                                                std::chrono::milliseconds request_sleep,
                                                const PagePause& pause) {
    const auto interval = std::max(request_sleep, kMinTradePageInterval);
    std::vector<nlohmann::json> trades;
    long long offset = 0;
    while (true) {
        auto page = parse_trade_page(fetch_page(offset));
        offset += static_cast<long long>(page.trades.size());
        for (auto& trade : page.trades) {
            trades.push_back(std::move(trade));
        }

        if (page.trades.empty() || offset >= page.count) {
            break;
        }
        std::cout << "[Kraken] Fetched " << offset << "/" << page.count << " trades" << std::endl;
        if (pause) {
            pause(interval);
        } else {
            std::this_thread::sleep_for(interval);
        }
    }
    sort_chronologically(trades);
    return trades;
}

std::vector<nlohmann::json> fetch_trade_history(const kraken::RestClient& client,
                                                std::chrono::milliseconds request_sleep) {
    const auto fetch_page = [&client](long long offset) {
        auto response = client.trades_history(offset);
        std::cout << "[Kraken] TradesHistory ofs=" << offset << " answered in "
                  << client.last_request_ms() << " ms" << std::endl;
        return response;
    };
    return fetch_trade_history(fetch_page, request_sleep);
}

PriceMap prices_from_ticker(const nlohmann::json& response, bool use_midprice) {
    PriceMap prices;
    if (!response.contains("result") || !response.at("result").is_object()) {
        return prices;
    }

    for (const auto& [pair_name, data] : response.at("result").items()) {
        if (use_midprice) {
            const auto bid = first_element(data, "b");
            const auto ask = first_element(data, "a");
            if (bid && ask) {
                prices[pair_name] = safe_div(Decimal(*bid + *ask), Decimal(2));
            }
        } else {
            const auto last = first_element(data, "c");
            if (last) {
                prices[pair_name] = *last;
            }
        }
    }
    return prices;
}

PriceMap fetch_current_prices(const kraken::RestClient& client,
                              const std::set<std::string>& pairs,
                              bool use_midprice) {
    if (pairs.empty()) {
        return {};
    }

    const auto response = client.ticker(std::vector<std::string>(pairs.begin(), pairs.end()));
    const auto errors = kraken::response_errors(response);
    if (!errors.empty()) {
        std::cerr << "[Prices] Ticker error: " << kraken::join_errors(errors)
                  << "; reporting without current prices" << std::endl;
        return {};
    }
    return prices_from_ticker(response, use_midprice);
}

} // namespace accounting
