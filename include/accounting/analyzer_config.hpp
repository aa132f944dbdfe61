#pragma once

#include "accounting/ledger_book.hpp"
#include "kraken/client_base.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace accounting {

struct AnalyzerConfig {
    kraken::Credentials credentials;
    kraken::RetryPolicy retry;
    bool include_fees_in_cost = true;               // buys capitalise fees, sells net them
    std::optional<std::set<std::string>> only_quotes;
    std::filesystem::path csv_path = "kraken_trade_averages.csv";
    std::chrono::milliseconds request_sleep{200};
    bool use_midprice = false;                      // (bid + ask) / 2 instead of last trade

    [[nodiscard]] LedgerBookConfig ledger_book_config() const;
};

// KEY=VALUE lines; '#' starts a comment line, surrounding double quotes are
// stripped. Existing variables are overwritten. Returns false if the file
// cannot be opened.
bool load_env_file(const std::filesystem::path& path);

// Defaults overridden by KRAKEN_* environment variables. Values that fail to
// parse are reported and the default kept.
AnalyzerConfig load_config_from_env();

std::optional<bool> parse_bool(const std::string& text);

std::set<std::string> parse_quote_list(const std::string& text);

} // namespace accounting
