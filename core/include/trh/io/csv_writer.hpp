#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace trh {
namespace io {

/// One output row: field name to formatted value
using ResultRecord = std::map<std::string, std::string>;

/**
 * @brief Options for delimited output.
 */
struct CsvWriterOptions {
    /// Field delimiter
    char delimiter = ',';

    /// Line terminator
    std::string line_terminator = "\r\n";
};

/**
 * @brief Writer for delimited result tables.
 *
 * Writes a header row followed by one row per record in the declared field
 * order. Fields missing from a record are written empty; fields a record
 * carries beyond the declared list are ignored. Values containing the
 * delimiter, a quote or a line break are double-quoted.
 */
class CsvWriter {
public:
    CsvWriter() = default;
    explicit CsvWriter(const CsvWriterOptions& options) : options_(options) {}

    /**
     * @brief Write records to a file.
     *
     * @param records Rows to write
     * @param filename Output path (truncated if it exists)
     * @param fieldnames Column order of the output
     * @throws std::runtime_error if the file cannot be written
     */
    void write(const std::vector<ResultRecord>& records,
               const std::string& filename,
               const std::vector<std::string>& fieldnames) const;

    /// Write records to a stream
    void write(const std::vector<ResultRecord>& records, std::ostream& out,
               const std::vector<std::string>& fieldnames) const;

    /// Format records as a string
    [[nodiscard]] std::string toString(const std::vector<ResultRecord>& records,
                                       const std::vector<std::string>& fieldnames) const;

    /// Quote a value if it needs quoting
    [[nodiscard]] std::string escape(const std::string& value) const;

    const CsvWriterOptions& options() const { return options_; }
    void setOptions(const CsvWriterOptions& opt) { options_ = opt; }

private:
    CsvWriterOptions options_;
};

/// Default column list of a quantification result table
std::vector<std::string> standardFieldnames();

} // namespace io
} // namespace trh
