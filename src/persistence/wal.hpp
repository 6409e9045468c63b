#pragma once

#include "persistence/log_entry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace walkv::persistence {

// ── Segment header constants ─────────────────────────────────────────────────

static constexpr char kSegmentMagic[] = "WALKV";      // 5 bytes (no NUL)
static constexpr std::size_t kSegmentMagicSize = 5;
static constexpr uint16_t kSegmentVersion = 1;
static constexpr std::size_t kSegmentHeaderSize = kSegmentMagicSize + sizeof(uint16_t);

static constexpr uint64_t kDefaultSegmentSize = 10 * 1024 * 1024;

// ── Options ──────────────────────────────────────────────────────────────────

struct WalOptions {
    std::filesystem::path dir;                   // Directory holding the segments
    uint64_t segment_size = kDefaultSegmentSize; // Rotation threshold in bytes
    CompressionOptions compression;              // Applied to new records only
};

// ── Segment ──────────────────────────────────────────────────────────────────
//
// One file of the log, named after the first sequence number it may hold:
//   <dir>/segment-00000000000000000001.log
// Lexical order of the names is creation order.

struct Segment {
    uint64_t first_sequence = 0;
    std::filesystem::path path;
};

// ── Write-Ahead Log ──────────────────────────────────────────────────────────
//
// Ordered set of append-only segment files. Every append is fdatasync'ed
// before it returns. Only the newest segment is open for writing; sealed
// segments are never modified, only deleted by remove_segments_through().
//
// Thread-safety: NOT thread-safe. The owner (KeyValueStore) serialises every
// call, including rotate().

class WAL {
public:
    explicit WAL(WalOptions options);
    ~WAL();

    // Non-copyable, non-movable.
    WAL(const WAL&) = delete;
    WAL& operator=(const WAL&) = delete;
    WAL(WAL&&) = delete;
    WAL& operator=(WAL&&) = delete;

    // Opens the newest segment for appending, creating the directory and the
    // first segment if needed. A torn record at the end of the newest segment
    // is cut off. Fails on a bad segment header, on mid-stream corruption in
    // the newest segment, and with std::errc::invalid_argument for a segment
    // size or compression level out of range.
    [[nodiscard]] std::error_code open();

    // Close the current segment. Idempotent.
    void close();

    // Assign the next sequence number to `entry`, append it durably and
    // report the number through `sequence`. Rotates first when the current
    // segment has reached the size threshold.
    //
    // On failure nothing is appended and no sequence number is consumed. If
    // a failed write cannot be rolled back the WAL refuses every later append
    // with std::errc::bad_file_descriptor.
    [[nodiscard]] std::error_code append(const LogEntry& entry, uint64_t& sequence);

    // Read every entry of every segment, in order. A torn record at the tail
    // of the newest segment ends the scan silently; any other damage fails
    // with std::errc::illegal_byte_sequence. Does not require open().
    [[nodiscard]] std::error_code read_all(std::vector<LogEntry>& entries) const;

    // Seal the current segment and start a new one. No-op when the current
    // segment holds no entries.
    [[nodiscard]] std::error_code rotate();

    // Delete every sealed segment whose entries all have a sequence number
    // <= `sequence`. The current segment is never deleted.
    [[nodiscard]] std::error_code remove_segments_through(uint64_t sequence);

    // All segments currently on disk, oldest first.
    [[nodiscard]] std::error_code list_segments(std::vector<Segment>& segments) const;

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    // Sequence number the next append will receive.
    [[nodiscard]] uint64_t next_sequence() const { return next_sequence_; }

    // Bytes in the current segment, header included.
    [[nodiscard]] uint64_t current_segment_size() const { return current_size_; }

    [[nodiscard]] const WalOptions& options() const { return options_; }

    [[nodiscard]] static std::string segment_filename(uint64_t first_sequence);

private:
    // Create a segment file for `first_sequence`, write its header and
    // make it durable. On success `fd` is open for appending.
    [[nodiscard]] std::error_code create_segment(uint64_t first_sequence, int& fd);

    // Write raw bytes to the current segment and fdatasync.
    [[nodiscard]] std::error_code write_bytes(const std::vector<uint8_t>& data);

    // Cut the current segment back to `current_size_` after a failed append.
    void rollback();

    WalOptions options_;
    int fd_ = -1;
    Segment current_;
    uint64_t current_size_ = 0;
    uint64_t current_entries_ = 0;
    uint64_t next_sequence_ = 1;
    bool failed_ = false;
};

} // namespace walkv::persistence
