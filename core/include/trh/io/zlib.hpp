#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace trh {
namespace io {

/**
 * @brief Zlib compression/decompression utilities.
 *
 * Used to read archived instrument reports stored gzip-compressed.
 */
class Zlib {
public:
    /**
     * @brief Decompress zlib or gzip compressed data.
     *
     * The stream header is detected automatically.
     *
     * @param input Compressed data
     * @return Decompressed data
     * @throws std::runtime_error if decompression fails
     */
    static std::vector<std::uint8_t> decompress(
        const std::vector<std::uint8_t>& input);

    /**
     * @brief Compress data using zlib.
     *
     * @param input Uncompressed data
     * @param level Compression level (0-9, default 6)
     * @param gzip_header true to write a gzip rather than a zlib header
     * @return Compressed data
     * @throws std::runtime_error if compression fails
     */
    static std::vector<std::uint8_t> compress(
        const std::vector<std::uint8_t>& input, int level = 6,
        bool gzip_header = false);

    /// Check for the gzip magic bytes
    static bool isGzip(const std::vector<std::uint8_t>& data) noexcept;

    /**
     * @brief Read a whole file, inflating it if gzip-compressed.
     *
     * @param filename Path to the file
     * @return File content as text
     * @throws std::runtime_error if the file cannot be read or inflated
     */
    static std::string readFileText(const std::string& filename);
};

} // namespace io
} // namespace trh
