#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

namespace walkv::persistence {

// ── Compression ──────────────────────────────────────────────────────────────
//
// How the key/value body of a log record is stored. The numeric value is
// written to disk.

enum class Compression : uint8_t {
    None = 0,
    Zlib = 1,
};

static constexpr int kDefaultCompressionLevel = 6;
static constexpr int kMinCompressionLevel = 0;
static constexpr int kMaxCompressionLevel = 9;

struct CompressionOptions {
    Compression type = Compression::None;
    int level = kDefaultCompressionLevel;  // zlib level, 0..9
};

[[nodiscard]] std::string_view to_string(Compression type) noexcept;

// "none" / "zlib" → Compression. Returns false for anything else.
[[nodiscard]] bool parse_compression(std::string_view name, Compression& out) noexcept;

[[nodiscard]] bool is_known_compression(uint8_t type) noexcept;

// Compress `size` bytes at `data` with zlib at `level` into `out`.
// Fails with std::errc::invalid_argument for a bad level and
// std::errc::not_enough_memory if zlib cannot allocate.
[[nodiscard]] std::error_code zlib_compress(const uint8_t* data, std::size_t size,
                                            int level, std::vector<uint8_t>& out);

// Inflate a zlib stream that must expand to exactly `raw_size` bytes.
// Fails with std::errc::illegal_byte_sequence for a damaged stream or a
// length mismatch.
[[nodiscard]] std::error_code zlib_decompress(const uint8_t* data, std::size_t size,
                                              std::size_t raw_size,
                                              std::vector<uint8_t>& out);

} // namespace walkv::persistence
