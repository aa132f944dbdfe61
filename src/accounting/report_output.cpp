#include "accounting/report_output.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace accounting {

ReportTable::ReportTable(std::ostream& out)
    : out_(out) {
}

std::vector<std::size_t> ReportTable::column_widths(const std::vector<ReportRow>& rows) const {
    const auto& headers = ReportRow::headers();
    std::vector<std::size_t> widths;
    widths.reserve(headers.size());
    for (const char* header : headers) {
        widths.push_back(std::string(header).size());
    }
    for (const auto& row : rows) {
        const auto fields = row.fields();
        for (std::size_t i = 0; i < fields.size(); ++i) {
            widths[i] = std::max(widths[i], fields[i].size());
        }
    }
    return widths;
}

void ReportTable::print_line(const std::vector<std::string>& cells, const std::vector<std::size_t>& widths) {
    std::ostringstream line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i != 0) {
            line << " | ";
        }
        line << std::setw(static_cast<int>(widths[i])) << std::left << cells[i];
    }
    out_ << line.str() << "\n";
}

void ReportTable::render(const std::vector<ReportRow>& rows) {
    if (rows.empty()) {
        out_ << "No trades found." << std::endl;
        return;
    }

    const auto widths = column_widths(rows);
    const auto& headers = ReportRow::headers();
    const std::vector<std::string> header_cells(headers.begin(), headers.end());
    print_line(header_cells, widths);

    std::size_t rule_length = 0;
    for (const auto width : widths) {
        rule_length += width;
    }
    rule_length += 3 * (widths.size() - 1);
    out_ << std::string(rule_length, '-') << "\n";

    for (const auto& row : rows) {
        const auto fields = row.fields();
        print_line(std::vector<std::string>(fields.begin(), fields.end()), widths);
    }
    out_ << std::flush;
}

std::string csv_escape(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string escaped = "\"";
    for (const char ch : cell) {
        if (ch == '"') {
            escaped += '"';
        }
        escaped += ch;
    }
    escaped += '"';
    return escaped;
}

void write_csv(const std::vector<ReportRow>& rows, const std::filesystem::path& path) {
    if (rows.empty()) {
        return;
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output.good()) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }

    const auto write_cells = [&output](const auto& cells) {
        bool first = true;
        for (const auto& cell : cells) {
            if (!first) {
                output << ',';
            }
            output << csv_escape(cell);
            first = false;
        }
        output << "\r\n";
    };

    write_cells(ReportRow::headers());
    for (const auto& row : rows) {
        write_cells(row.fields());
    }

    output.flush();
    if (!output.good()) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

} // namespace accounting
