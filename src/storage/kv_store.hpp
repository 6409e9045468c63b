#pragma once

#include "persistence/log_entry.hpp"
#include "persistence/wal.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace walkv {

struct StoreOptions {
    std::filesystem::path data_dir;  // Holds wal/ and snapshot.bin
    uint64_t segment_size = persistence::kDefaultSegmentSize;
    persistence::CompressionOptions compression;
};

// Durable key-value store: an in-memory map in front of a write-ahead log.
//
// Every mutation is appended (and fdatasync'ed) to the WAL before it touches
// the map; if the append fails the map is left as it was and the WAL's
// error_code is returned unchanged.
//
// Concurrency model:
//   - put() / del() / checkpoint() / compact() / recover() hold write_mutex_
//     across append + apply, so WAL order equals the order effects become
//     visible.
//   - The map has its own reader/writer lock, taken exclusively only for the
//     apply step. get() / keys() / size() take it shared and never wait for a
//     storage flush.
class KeyValueStore {
public:
    explicit KeyValueStore(StoreOptions options);
    ~KeyValueStore();

    // Not copyable or movable – connections hold references to one instance.
    KeyValueStore(const KeyValueStore&)            = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;
    KeyValueStore(KeyValueStore&&)                 = delete;
    KeyValueStore& operator=(KeyValueStore&&)      = delete;

    // Open the WAL (creating the data directory if needed).
    [[nodiscard]] std::error_code open();

    // Rebuild the map from the snapshot (if any) and the WAL. Call once after
    // open() and before serving requests. Idempotent.
    [[nodiscard]] std::error_code recover();

    // Log a PUT, then insert or overwrite `key`.
    [[nodiscard]] std::error_code put(std::string key, std::string value);

    // Log a DELETE, then remove `key`. An absent key is still logged.
    // `removed`, if given, reports whether the key existed.
    [[nodiscard]] std::error_code del(std::string_view key, bool* removed = nullptr);

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Returns a sorted snapshot of all keys.
    [[nodiscard]] std::vector<std::string> keys() const;

    // Returns the number of stored key-value pairs.
    [[nodiscard]] std::size_t size() const;

    // Returns a full copy of the current map.
    [[nodiscard]] std::unordered_map<std::string, std::string> snapshot() const;

    // Log a CHECKPOINT marker and seal the current segment behind it.
    // Fails only if the marker could not be logged; a failed rotation is
    // logged and leaves the marker in the current segment.
    [[nodiscard]] std::error_code checkpoint();

    // Write a snapshot of the map, then drop every segment it covers.
    [[nodiscard]] std::error_code compact();

    // Close the WAL. Later mutations fail with bad_file_descriptor.
    void close();

    // Sequence number of the most recent durable entry (0 if none).
    [[nodiscard]] uint64_t last_sequence() const;

    [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }

    [[nodiscard]] std::filesystem::path snapshot_path() const;

private:
    // Append `entry` to the WAL. Caller holds write_mutex_.
    [[nodiscard]] std::error_code log(const persistence::LogEntry& entry);

    StoreOptions options_;

    mutable std::mutex write_mutex_;
    persistence::WAL wal_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::string> map_;
};

} // namespace walkv
