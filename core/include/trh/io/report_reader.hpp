#pragma once

#include "../sample_run.hpp"
#include "../errors.hpp"
#include <string>
#include <vector>

namespace trh {
namespace io {

/**
 * @brief Options for instrument report reading.
 *
 * Labels match the integration report layout; they are searched for by
 * exact cell text after trimming surrounding whitespace.
 */
struct ReportReaderOptions {
    /// Field delimiter of the exported report
    char delimiter = ',';

    /// Label preceding the sample name on its row
    std::string sample_name_label = "Sample Name";

    /// Label preceding the acquisition time on its row
    std::string acquired_time_label = "Acquired Time";

    /// Title cell introducing the peak table
    std::string peak_list_title = "Integration Peak List";

    /// Column holding the title cell and the peak numbers
    std::size_t peak_index_column = 0;

    /// Header of the integration start column
    std::string start_header = "Start";

    /// Header of the apex retention time column
    std::string rt_header = "RT";

    /// Header of the integration end column
    std::string end_header = "End";

    /// Header of the peak area column
    std::string area_header = "Area";

    /// Check peak ordering and consistency after reading
    bool validate = true;
};

/// Cell grid of a delimited text file, row-major
using CellGrid = std::vector<std::vector<std::string>>;

/**
 * @brief Reader for exported GC-MS integration reports.
 *
 * The report is a spreadsheet saved as delimited text. The sample name and
 * acquisition time sit to the right of their labels; the peak table follows
 * a title row, starts with a header row and ends at the first row without
 * a peak number. Gzip-compressed files are inflated transparently.
 *
 * Usage:
 * @code
 * ReportReader reader;
 * SampleRun run = reader.read("sample_042.csv");
 * @endcode
 */
class ReportReader {
public:
    ReportReader() = default;
    explicit ReportReader(const ReportReaderOptions& options)
        : options_(options) {}

    /**
     * @brief Read a report file.
     *
     * @param filename Path to the report (plain or gzip-compressed)
     * @return Parsed run with source file set
     * @throws ReportParseError if the file cannot be read or parsed
     */
    SampleRun read(const std::string& filename) const;

    /**
     * @brief Parse report content from a string.
     *
     * @throws ReportParseError if parsing fails
     */
    SampleRun parseString(const std::string& content) const;

    /**
     * @brief Parse an already split cell grid.
     *
     * @throws ReportParseError if parsing fails
     */
    SampleRun parseGrid(const CellGrid& grid) const;

    /**
     * @brief Check if a file appears to be an integration report.
     *
     * @param filename Path to check
     * @return true if the file can be read and contains the peak list title
     */
    bool isValidReport(const std::string& filename) const noexcept;

    /**
     * @brief Get/set options
     */
    const ReportReaderOptions& options() const { return options_; }
    void setOptions(const ReportReaderOptions& opt) { options_ = opt; }

private:
    ReportReaderOptions options_;
};

/**
 * @brief Split delimited text into cells.
 *
 * Fields may be double-quoted; quoted fields may contain the delimiter,
 * doubled quotes and line breaks. CRLF and LF line endings are accepted.
 */
CellGrid splitDelimited(const std::string& content, char delimiter = ',');

/**
 * @brief Convenience function to load a report with default options.
 */
inline SampleRun loadReport(const std::string& filename) {
    ReportReader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace trh
