#include "accounting/balance_adjuster.hpp"

#include "kraken/util.hpp"

#include <algorithm>
#include <cctype>

namespace accounting {
namespace {

struct AdjustableItem {
    PairKey key;
    Decimal remaining;
};

bool all_digits(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

} // namespace

std::vector<std::size_t> parse_selection(const std::string& choice, std::size_t item_count) {
    std::vector<std::size_t> indices;
    if (kraken::to_lower_copy(kraken::trim_copy(choice)) == "all") {
        for (std::size_t i = 1; i <= item_count; ++i) {
            indices.push_back(i);
        }
        return indices;
    }

    for (const auto& part : kraken::split(choice, ',')) {
        const auto token = kraken::trim_copy(part);
        if (!all_digits(token) || token.size() > 9) {
            continue;
        }
        const auto index = static_cast<std::size_t>(std::stoul(token));
        if (index >= 1 && index <= item_count) {
            indices.push_back(index);
        }
    }
    return indices;
}

BalanceAdjuster::BalanceAdjuster(std::istream& in, std::ostream& out)
    : in_(in),
      out_(out) {
}

bool BalanceAdjuster::prompt(const std::string& question, std::string& answer) {
    out_ << question << std::flush;
    if (!std::getline(in_, answer)) {
        out_ << "\n";
        return false;
    }
    return true;
}

std::size_t BalanceAdjuster::run(LedgerBook& book) {
    std::string answer;
    if (!prompt("Adjust current balances? (Y/N): ", answer)) {
        return 0;
    }
    answer = kraken::to_lower_copy(kraken::trim_copy(answer));
    if (answer != "y" && answer != "yes") {
        return 0;
    }

    std::vector<AdjustableItem> items;
    for (const auto& [key, ledger] : book.ledgers()) {
        const auto remaining = ledger.remaining_inventory().volume;
        if (remaining > 0) {
            items.push_back({key, remaining});
        }
    }

    if (items.empty()) {
        out_ << "Nothing to adjust (no remaining inventory from history)." << std::endl;
        return 0;
    }

    out_ << "\nSelect which assets to adjust (by index, comma-separated) or type 'all':\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
        out_ << "[" << (i + 1) << "] " << items[i].key.display()
             << "  remaining=" << to_string(items[i].remaining) << "\n";
    }

    std::string choice;
    if (!prompt("Your choice: ", choice)) {
        return 0;
    }

    const auto indices = parse_selection(choice, items.size());
    if (indices.empty()) {
        out_ << "No valid selection; skipping adjustments." << std::endl;
        return 0;
    }

    std::size_t adjusted = 0;
    for (const auto index : indices) {
        const auto& item = items[index - 1];
        while (true) {
            std::string target_text;
            if (!prompt("Set target remaining volume for " + item.key.display() +
                            " (current " + to_string(item.remaining) + ", usually 0): ",
                        target_text)) {
                return adjusted;
            }

            const auto target = parse_decimal(target_text);
            if (!target) {
                out_ << "Please enter a valid number (e.g., 0 or 0.123456)." << std::endl;
                continue;
            }

            const auto status = book.adjust_remaining(item.key, *target);
            if (status == AdjustmentStatus::InvalidTarget) {
                out_ << "Target cannot be negative." << std::endl;
                continue;
            }
            if (status == AdjustmentStatus::Applied) {
                ++adjusted;
            }
            break;
        }
    }
    return adjusted;
}

} // namespace accounting
