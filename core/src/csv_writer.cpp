#include "trh/io/csv_writer.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace trh {
namespace io {

std::string CsvWriter::escape(const std::string& value) const {
    if (value.find_first_of(std::string(1, options_.delimiter) + "\"\r\n") ==
        std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') quoted += '"';
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

void CsvWriter::write(const std::vector<ResultRecord>& records, std::ostream& out,
                      const std::vector<std::string>& fieldnames) const {
    for (std::size_t i = 0; i < fieldnames.size(); ++i) {
        if (i > 0) out << options_.delimiter;
        out << escape(fieldnames[i]);
    }
    out << options_.line_terminator;

    for (const auto& record : records) {
        for (std::size_t i = 0; i < fieldnames.size(); ++i) {
            if (i > 0) out << options_.delimiter;
            auto it = record.find(fieldnames[i]);
            if (it != record.end()) {
                out << escape(it->second);
            }
        }
        out << options_.line_terminator;
    }
}

void CsvWriter::write(const std::vector<ResultRecord>& records,
                      const std::string& filename,
                      const std::vector<std::string>& fieldnames) const {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filename);
    }

    write(records, file, fieldnames);

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}

std::string CsvWriter::toString(const std::vector<ResultRecord>& records,
                                const std::vector<std::string>& fieldnames) const {
    std::ostringstream out;
    write(records, out, fieldnames);
    return out.str();
}

std::vector<std::string> standardFieldnames() {
    return {"sample_name", "acquired_time", "fraction", "concentration",
            "area", "istd_area", "response_ratio", "dilution_factor",
            "source_file"};
}

} // namespace io
} // namespace trh
