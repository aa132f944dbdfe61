#include "accounting/analyzer_config.hpp"

#include "kraken/util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace accounting {
namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void report_invalid(const char* name, const std::string& value) {
    std::cerr << "[Config] Ignoring invalid " << name << "=" << value << std::endl;
}

template <typename Parser, typename Apply>
void read_env(const char* name, Parser parse, Apply apply) {
    const auto raw = env_value(name);
    if (!raw || kraken::trim_copy(*raw).empty()) {
        return;
    }
    const auto parsed = parse(kraken::trim_copy(*raw));
    if (!parsed) {
        report_invalid(name, *raw);
        return;
    }
    apply(*parsed);
}

std::optional<long long> parse_non_negative_integer(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value < 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> parse_fraction(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || value < 0.0 || value > 1.0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace

LedgerBookConfig AnalyzerConfig::ledger_book_config() const {
    LedgerBookConfig config;
    config.include_fees_in_cost = include_fees_in_cost;
    config.quote_filter = only_quotes;
    return config;
}

bool load_env_file(const std::filesystem::path& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = kraken::trim_copy(line.substr(0, pos));
        auto value = kraken::trim_copy(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
    return true;
}

std::optional<bool> parse_bool(const std::string& text) {
    const auto lowered = kraken::to_lower_copy(kraken::trim_copy(text));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

std::set<std::string> parse_quote_list(const std::string& text) {
    std::set<std::string> quotes;
    for (const auto& part : kraken::split(text, ',')) {
        auto quote = kraken::to_upper_copy(kraken::trim_copy(part));
        if (!quote.empty()) {
            quotes.insert(std::move(quote));
        }
    }
    return quotes;
}

AnalyzerConfig load_config_from_env() {
    AnalyzerConfig config;
    config.credentials.api_key = env_value("KRAKEN_KEY").value_or("");
    config.credentials.api_secret = env_value("KRAKEN_SECRET").value_or("");

    read_env("KRAKEN_INCLUDE_FEES_IN_COST", parse_bool,
             [&](bool value) { config.include_fees_in_cost = value; });
    read_env("KRAKEN_USE_MIDPRICE", parse_bool,
             [&](bool value) { config.use_midprice = value; });
    read_env("KRAKEN_ONLY_QUOTES",
             [](const std::string& text) -> std::optional<std::set<std::string>> {
                 auto quotes = parse_quote_list(text);
                 if (quotes.empty()) {
                     return std::nullopt;
                 }
                 return quotes;
             },
             [&](const std::set<std::string>& quotes) { config.only_quotes = quotes; });
    read_env("KRAKEN_CSV_OUT",
             [](const std::string& text) { return std::optional<std::string>(text); },
             [&](const std::string& path) { config.csv_path = path; });
    read_env("KRAKEN_REQUEST_SLEEP_MS", parse_non_negative_integer,
             [&](long long value) { config.request_sleep = std::chrono::milliseconds(value); });
    read_env("KRAKEN_MAX_RETRIES", parse_non_negative_integer,
             [&](long long value) { config.retry.max_retries = static_cast<int>(value); });
    read_env("KRAKEN_BASE_BACKOFF_MS", parse_non_negative_integer,
             [&](long long value) { config.retry.base_backoff_s = static_cast<double>(value) / 1000.0; });
    read_env("KRAKEN_BACKOFF_JITTER", parse_fraction,
             [&](double value) { config.retry.jitter = value; });

    return config;
}

} // namespace accounting
