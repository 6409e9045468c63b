#pragma once

#include "persistence/compression.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace walkv::persistence {

// ── Operation ────────────────────────────────────────────────────────────────

enum class Operation : uint8_t {
    Put        = 1,
    Delete     = 2,
    Checkpoint = 3,
};

[[nodiscard]] std::string_view to_string(Operation op) noexcept;

// ── Record framing constants ─────────────────────────────────────────────────

static constexpr uint8_t kLogEntryFormatVersion = 2;

// [format_version: u8][payload_length: u32 LE]
static constexpr std::size_t kEntryHeaderSize = 1 + 4;

// [crc32: u32 LE]
static constexpr std::size_t kEntryTrailerSize = 4;

// sequence(8) + operation(1) + timestamp_us(8) + compression(1)
static constexpr std::size_t kEntryBodyOffset = 8 + 1 + 8 + 1;

// Payload of an uncompressed record without key and value bytes:
// the fields above + key_length(4) + value_length(4)
static constexpr std::size_t kEntryFixedPayloadSize = kEntryBodyOffset + 4 + 4;

// ── LogEntry ─────────────────────────────────────────────────────────────────
//
// Immutable record of one store operation.
//
// Wire format (little-endian):
//
//   [format_version: u8 = 2][payload_length: u32]
//     [sequence: u64][operation: u8][timestamp_us: i64][compression: u8]
//     [body]
//   [crc32: u32]      // covers format_version through body
//
//   body, compression = None:  [key_length: u32][key][value_length: u32][value]
//   body, compression = Zlib:  [raw_length: u32][zlib stream of the None body]
//
// Key is empty for CHECKPOINT; value is empty for DELETE and CHECKPOINT.
// A sequence of 0 means "not yet assigned by a WAL".

class LogEntry {
public:
    using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                              std::chrono::microseconds>;

    // Empty CHECKPOINT entry with sequence 0. Used as a decode target.
    LogEntry() = default;

    // Factories stamp the entry with the current wall-clock time.
    [[nodiscard]] static LogEntry put(std::string key, std::string value);
    [[nodiscard]] static LogEntry del(std::string key);
    [[nodiscard]] static LogEntry checkpoint();

    // Returns a copy of this entry carrying `sequence`.
    [[nodiscard]] LogEntry with_sequence(uint64_t sequence) const;

    [[nodiscard]] uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] Operation operation() const noexcept { return operation_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }

    // Serialise to one self-delimiting record (header, payload and CRC).
    // With Compression::Zlib the body is deflated, but stored raw when that
    // would not make it smaller.
    [[nodiscard]] std::vector<uint8_t> encode(const CompressionOptions& compression = {}) const;

    // Decode the record starting at `data`.
    //
    // On success fills `out`, sets `consumed` to the record's total size and
    // returns an empty error_code. Fails with:
    //   std::errc::message_size          – input ends before the record does
    //   std::errc::illegal_byte_sequence – bad version, CRC, operation,
    //                                      compression or field layout
    [[nodiscard]] static std::error_code decode(const uint8_t* data,
                                                std::size_t size,
                                                LogEntry& out,
                                                std::size_t& consumed);

    // Total on-disk size of the record starting at `data`, read from its
    // header alone. Returns false if the header is incomplete or its version
    // is unknown.
    [[nodiscard]] static bool framed_size(const uint8_t* data, std::size_t size,
                                          std::size_t& out) noexcept;

    bool operator==(const LogEntry&) const = default;

private:
    LogEntry(uint64_t sequence, Operation operation, std::string key,
             std::string value, Timestamp timestamp);

    [[nodiscard]] static Timestamp now();

    uint64_t sequence_ = 0;
    Operation operation_ = Operation::Checkpoint;
    std::string key_;
    std::string value_;
    Timestamp timestamp_{};
};

} // namespace walkv::persistence
