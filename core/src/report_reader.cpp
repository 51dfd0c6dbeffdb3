#include "trh/io/report_reader.hpp"
#include "trh/io/zlib.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace trh {
namespace io {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string cellAt(const CellGrid& grid, std::size_t row, std::size_t col) {
    if (row >= grid.size() || col >= grid[row].size()) return "";
    return trim(grid[row][col]);
}

std::string location(std::size_t row, std::size_t col) {
    return "row " + std::to_string(row + 1) + ", column " + std::to_string(col + 1);
}

// Value of the first non-empty cell to the right of a label
std::string labelledValue(const CellGrid& grid, const std::string& label) {
    for (std::size_t r = 0; r < grid.size(); ++r) {
        for (std::size_t c = 0; c < grid[r].size(); ++c) {
            if (trim(grid[r][c]) != label) continue;

            for (std::size_t v = c + 1; v < grid[r].size(); ++v) {
                std::string value = trim(grid[r][v]);
                if (!value.empty()) return value;
            }
            throw ReportParseError("No value after '" + label + "' at " +
                                   location(r, c));
        }
    }
    throw ReportParseError("Label '" + label + "' not found");
}

std::size_t findColumn(const CellGrid& grid, std::size_t header_row,
                       const std::string& header) {
    for (std::size_t c = 0; c < grid[header_row].size(); ++c) {
        if (trim(grid[header_row][c]) == header) return c;
    }
    throw ReportParseError("Column '" + header + "' not found in peak table header (" +
                           location(header_row, 0) + ")");
}

double parseNumber(const CellGrid& grid, std::size_t row, std::size_t col) {
    std::string text = cellAt(grid, row, col);
    if (text.empty()) {
        throw ReportParseError("Missing value at " + location(row, col));
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE ||
        !std::isfinite(value)) {
        throw ReportParseError("Invalid number '" + text + "' at " +
                               location(row, col));
    }
    return value;
}

} // namespace

CellGrid splitDelimited(const std::string& content, char delimiter) {
    CellGrid grid;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_started = false;

    for (std::size_t i = 0; i < content.size(); ++i) {
        char ch = content[i];

        if (in_quotes) {
            if (ch == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += ch;
            }
            continue;
        }

        if (ch == '"') {
            in_quotes = true;
            row_started = true;
        } else if (ch == delimiter) {
            row.push_back(std::move(field));
            field.clear();
            row_started = true;
        } else if (ch == '\n' || ch == '\r') {
            if (ch == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
                ++i;
            }
            row.push_back(std::move(field));
            field.clear();
            grid.push_back(std::move(row));
            row.clear();
            row_started = false;
        } else {
            field += ch;
            row_started = true;
        }
    }

    if (row_started || !field.empty()) {
        row.push_back(std::move(field));
        grid.push_back(std::move(row));
    }
    return grid;
}

SampleRun ReportReader::read(const std::string& filename) const {
    std::string content;
    try {
        content = Zlib::readFileText(filename);
    } catch (const std::runtime_error& e) {
        throw ReportParseError(filename + ": " + e.what());
    }

    SampleRun run;
    try {
        run = parseString(content);
    } catch (const ReportParseError& e) {
        throw ReportParseError(filename + ": " + e.detail());
    }
    run.setSourceFile(filename);
    return run;
}

SampleRun ReportReader::parseString(const std::string& content) const {
    return parseGrid(splitDelimited(content, options_.delimiter));
}

SampleRun ReportReader::parseGrid(const CellGrid& grid) const {
    SampleRun run;
    run.setName(labelledValue(grid, options_.sample_name_label));
    run.setAcquiredTime(labelledValue(grid, options_.acquired_time_label));

    // Find beginning of the peak table
    const std::size_t idx_col = options_.peak_index_column;
    std::size_t title_row = 0;
    while (title_row < grid.size() &&
           cellAt(grid, title_row, idx_col) != options_.peak_list_title) {
        ++title_row;
    }
    if (title_row == grid.size()) {
        throw ReportParseError("Peak table title '" + options_.peak_list_title +
                               "' not found in column " +
                               std::to_string(idx_col + 1));
    }

    const std::size_t header_row = title_row + 1;
    if (header_row >= grid.size()) {
        throw ReportParseError("Peak table header missing after " +
                               location(title_row, idx_col));
    }

    const std::size_t start_col = findColumn(grid, header_row, options_.start_header);
    const std::size_t rt_col = findColumn(grid, header_row, options_.rt_header);
    const std::size_t end_col = findColumn(grid, header_row, options_.end_header);
    const std::size_t area_col = findColumn(grid, header_row, options_.area_header);

    // Peak rows run until the first blank peak number
    PeakList peaks;
    for (std::size_t r = header_row + 1;
         r < grid.size() && !cellAt(grid, r, idx_col).empty(); ++r) {
        double number = parseNumber(grid, r, idx_col);
        // Index max is not exactly representable; its double rounds up
        if (number < 1.0 || number != std::floor(number) ||
            number >= static_cast<double>(std::numeric_limits<Index>::max())) {
            throw ReportParseError("Invalid peak number '" +
                                   cellAt(grid, r, idx_col) + "' at " +
                                   location(r, idx_col));
        }

        peaks.add(static_cast<Index>(number),
                  parseNumber(grid, r, start_col),
                  parseNumber(grid, r, rt_col),
                  parseNumber(grid, r, end_col),
                  parseNumber(grid, r, area_col));
    }

    if (options_.validate) {
        try {
            peaks.validate();
        } catch (const std::invalid_argument& e) {
            throw ReportParseError(e.what());
        }
    }

    run.setPeaks(std::move(peaks));
    return run;
}

bool ReportReader::isValidReport(const std::string& filename) const noexcept {
    try {
        std::string content = Zlib::readFileText(filename);
        CellGrid grid = splitDelimited(content, options_.delimiter);
        for (std::size_t r = 0; r < grid.size(); ++r) {
            if (cellAt(grid, r, options_.peak_index_column) ==
                options_.peak_list_title) {
                return true;
            }
        }
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

} // namespace io
} // namespace trh
