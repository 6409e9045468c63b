#include "persistence/compression.hpp"

#include <utility>

#include <zlib.h>

namespace walkv::persistence {

namespace {

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

} // anonymous namespace

std::string_view to_string(Compression type) noexcept {
    switch (type) {
        case Compression::None: return "none";
        case Compression::Zlib: return "zlib";
    }
    return "unknown";
}

bool parse_compression(std::string_view name, Compression& out) noexcept {
    if (name == "none") {
        out = Compression::None;
        return true;
    }
    if (name == "zlib") {
        out = Compression::Zlib;
        return true;
    }
    return false;
}

bool is_known_compression(uint8_t type) noexcept {
    return type == static_cast<uint8_t>(Compression::None) ||
           type == static_cast<uint8_t>(Compression::Zlib);
}

std::error_code zlib_compress(const uint8_t* data, std::size_t size,
                              int level, std::vector<uint8_t>& out) {
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        return make_error(std::errc::invalid_argument);
    }

    uLongf out_len = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> buf(out_len);
    const int rc = compress2(buf.data(), &out_len, data, static_cast<uLong>(size), level);
    switch (rc) {
        case Z_OK:
            break;
        case Z_MEM_ERROR:
            return make_error(std::errc::not_enough_memory);
        default:
            return make_error(std::errc::invalid_argument);
    }

    buf.resize(out_len);
    out = std::move(buf);
    return {};
}

std::error_code zlib_decompress(const uint8_t* data, std::size_t size,
                                std::size_t raw_size, std::vector<uint8_t>& out) {
    std::vector<uint8_t> buf(raw_size);
    uLongf out_len = static_cast<uLongf>(raw_size);

    const int rc = uncompress(buf.data(), &out_len, data, static_cast<uLong>(size));
    if (rc == Z_MEM_ERROR) {
        return make_error(std::errc::not_enough_memory);
    }
    if (rc != Z_OK || out_len != raw_size) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    out = std::move(buf);
    return {};
}

} // namespace walkv::persistence
