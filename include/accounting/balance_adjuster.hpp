#pragma once

#include "accounting/ledger_book.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace accounting {

// 1-based menu indices from "all" or a comma-separated list. Entries that are
// not plain numbers or fall outside [1, item_count] are dropped.
std::vector<std::size_t> parse_selection(const std::string& choice, std::size_t item_count);

// Operator dialogue that trims remaining inventory to match balances held
// elsewhere. End of input at any prompt stops without further changes.
class BalanceAdjuster {
public:
    BalanceAdjuster(std::istream& in, std::ostream& out);

    BalanceAdjuster(const BalanceAdjuster&) = delete;
    BalanceAdjuster& operator=(const BalanceAdjuster&) = delete;

    // Returns the number of pairs whose inventory was reduced.
    std::size_t run(LedgerBook& book);

private:
    bool prompt(const std::string& question, std::string& answer);

    std::istream& in_;
    std::ostream& out_;
};

} // namespace accounting
