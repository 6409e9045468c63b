#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_map>

namespace walkv::persistence {

// ── Snapshot header constants ────────────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "WKSS";          // 4 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 4;
static constexpr uint16_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize =
    kSnapshotMagicSize + sizeof(uint16_t);                // 6 bytes

// ── Snapshot load result ─────────────────────────────────────────────────────

struct SnapshotLoadResult {
    uint64_t last_sequence = 0;
    std::unordered_map<std::string, std::string> data;
};

// ── Snapshot ─────────────────────────────────────────────────────────────────
//
// Full-state image of the store written by compaction. Binary format:
//
//   [magic: "WKSS" (4B)][version: u16 LE = 1]
//   [last_sequence: u64 LE]
//   [entry_count: u32 LE]
//     [key_length: u32 LE][key][value_length: u32 LE][value]  × entry_count
//   [crc32: u32 LE]     // CRC of everything from magic through last value
//
// `last_sequence` is the highest WAL sequence number whose effect the image
// contains. Recovery replays only entries after it.
//
// File path: <data_dir>/snapshot.bin
// Atomic write: write to .tmp, then rename.

class Snapshot {
public:
    // Default snapshot filename.
    static constexpr const char* kFilename = "snapshot.bin";

    // Save a snapshot atomically to `path`.
    // Writes to `<path>.tmp` first, then renames.
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        const std::unordered_map<std::string, std::string>& data,
        uint64_t last_sequence);

    // Load a snapshot from `path`.
    // Validates magic, version, and CRC32.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        SnapshotLoadResult& result);

    // Check if a snapshot file exists at `path`.
    [[nodiscard]] static bool exists(const std::filesystem::path& path);
};

} // namespace walkv::persistence
