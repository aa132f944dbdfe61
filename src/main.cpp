#include "accounting/analyzer_config.hpp"
#include "accounting/balance_adjuster.hpp"
#include "accounting/ledger_book.hpp"
#include "accounting/market_data.hpp"
#include "accounting/report_output.hpp"
#include "accounting/valuation.hpp"
#include "kraken/rest_client.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace {

int run() {
    accounting::load_env_file(".env");
    const auto config = accounting::load_config_from_env();
    if (config.credentials.api_key.empty() || config.credentials.api_secret.empty()) {
        throw std::runtime_error("Set KRAKEN_KEY and KRAKEN_SECRET environment variables.");
    }

    kraken::RestClient client{config.credentials, config.retry};

    std::cout << "Fetching trades from Kraken (read-only)..." << std::endl;
    const auto trades = accounting::fetch_trade_history(client, config.request_sleep);
    std::cout << "Fetched " << trades.size() << " trades." << std::endl;

    accounting::LedgerBook book{config.ledger_book_config()};
    const auto summary = book.apply_all(trades);
    std::cout << "[Ledger] Applied " << summary.applied << " trades across " << book.size() << " pairs";
    if (summary.malformed != 0 || summary.filtered != 0 || summary.ignored != 0) {
        std::cout << " (malformed=" << summary.malformed
                  << ", filtered=" << summary.filtered
                  << ", ignored=" << summary.ignored << ")";
    }
    std::cout << std::endl;
    if (summary.oversold != 0) {
        std::cerr << "[Ledger] " << summary.oversold
                  << " sells exceeded recorded inventory; buy history may be missing" << std::endl;
    }

    accounting::BalanceAdjuster adjuster{std::cin, std::cout};
    adjuster.run(book);

    const auto prices = accounting::fetch_current_prices(client, book.pair_identifiers(), config.use_midprice);
    const auto rows = accounting::compute_report(book, prices);

    accounting::ReportTable table{std::cout};
    table.render(rows);

    if (!rows.empty()) {
        accounting::write_csv(rows, config.csv_path);
        std::cout << "Wrote " << config.csv_path.string() << std::endl;
    } else {
        std::cout << "[Export] No rows to export; " << config.csv_path.string() << " not written" << std::endl;
    }
    return EXIT_SUCCESS;
}

} // namespace

int main() {
    try {
        return run();
    } catch (const kraken::HttpError& ex) {
        std::cerr << "ERROR: " << ex.what() << " (status " << ex.status_code() << ")" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
    }
    return EXIT_FAILURE;
}
