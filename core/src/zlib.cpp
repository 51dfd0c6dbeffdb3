#include "trh/io/zlib.hpp"
#include <fstream>
#include <iterator>
#include <zlib.h>

namespace trh {
namespace io {

namespace {

// windowBits offsets selecting the stream header (see zlib.h)
constexpr int kAutoDetectHeader = 32;
constexpr int kGzipHeader = 16;

} // namespace

std::vector<std::uint8_t> Zlib::decompress(const std::vector<std::uint8_t>& input) {
    if (input.empty()) {
        return {};
    }

    // Estimate output size (start with 4x input size)
    std::vector<std::uint8_t> output;
    std::size_t output_size = input.size() * 4;
    output.resize(output_size);

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    if (inflateInit2(&stream, MAX_WBITS + kAutoDetectHeader) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompression");
    }

    int result;
    while ((result = inflate(&stream, Z_NO_FLUSH)) != Z_STREAM_END) {
        if (result == Z_OK || (result == Z_BUF_ERROR && stream.avail_out == 0)) {
            if (stream.avail_in == 0 && stream.avail_out != 0) {
                inflateEnd(&stream);
                throw std::runtime_error("Zlib decompression failed: truncated input");
            }
            // Need more output space
            std::size_t current = output.size() - stream.avail_out;
            output_size *= 2;
            output.resize(output_size);
            stream.next_out = output.data() + current;
            stream.avail_out = static_cast<uInt>(output_size - current);
        } else {
            inflateEnd(&stream);
            throw std::runtime_error("Zlib decompression failed");
        }
    }

    output.resize(output.size() - stream.avail_out);
    inflateEnd(&stream);

    return output;
}

std::vector<std::uint8_t> Zlib::compress(const std::vector<std::uint8_t>& input,
                                         int level, bool gzip_header) {
    if (input.empty()) {
        return {};
    }

    z_stream stream{};
    int window_bits = gzip_header ? MAX_WBITS + kGzipHeader : MAX_WBITS;
    if (deflateInit2(&stream, level, Z_DEFLATED, window_bits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compression");
    }

    // Worst case compressed size
    std::vector<std::uint8_t> output(
        deflateBound(&stream, static_cast<uLong>(input.size())));

    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&stream);
        throw std::runtime_error("Zlib compression failed");
    }

    output.resize(stream.total_out);
    deflateEnd(&stream);
    return output;
}

bool Zlib::isGzip(const std::vector<std::uint8_t>& data) noexcept {
    return data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b;
}

std::string Zlib::readFileText(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + filename);
    }

    if (isGzip(bytes)) {
        bytes = decompress(bytes);
    }
    return std::string(bytes.begin(), bytes.end());
}

} // namespace io
} // namespace trh
