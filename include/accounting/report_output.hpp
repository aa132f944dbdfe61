#pragma once

#include "accounting/valuation.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace accounting {

// Column-aligned console table for report rows.
class ReportTable {
public:
    explicit ReportTable(std::ostream& out = std::cout);

    ReportTable(const ReportTable&) = delete;
    ReportTable& operator=(const ReportTable&) = delete;

    void render(const std::vector<ReportRow>& rows);

private:
    std::vector<std::size_t> column_widths(const std::vector<ReportRow>& rows) const;
    void print_line(const std::vector<std::string>& cells, const std::vector<std::size_t>& widths);

    std::ostream& out_;
};

std::string csv_escape(const std::string& cell);

// Writes nothing for an empty report. Throws std::runtime_error when the
// file cannot be written.
void write_csv(const std::vector<ReportRow>& rows, const std::filesystem::path& path);

} // namespace accounting
