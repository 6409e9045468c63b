#include "storage/kv_store.hpp"
#include "persistence/snapshot.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace walkv {

using persistence::LogEntry;
using persistence::Operation;
using persistence::Snapshot;

namespace {

constexpr const char* kWalDirName = "wal";

// PUT sets, DELETE removes, CHECKPOINT leaves the map alone.
void apply_entry(std::unordered_map<std::string, std::string>& map,
                 const LogEntry& entry) {
    switch (entry.operation()) {
        case Operation::Put:
            map.insert_or_assign(entry.key(), entry.value());
            break;
        case Operation::Delete:
            map.erase(entry.key());
            break;
        case Operation::Checkpoint:
            break;
    }
}

} // anonymous namespace

KeyValueStore::KeyValueStore(StoreOptions options)
    : options_(std::move(options)),
      wal_(persistence::WalOptions{options_.data_dir / kWalDirName,
                                   options_.segment_size,
                                   options_.compression}) {}

KeyValueStore::~KeyValueStore() {
    close();
}

std::filesystem::path KeyValueStore::snapshot_path() const {
    return options_.data_dir / Snapshot::kFilename;
}

std::error_code KeyValueStore::open() {
    std::lock_guard write_lock(write_mutex_);
    return wal_.open();
}

void KeyValueStore::close() {
    std::lock_guard write_lock(write_mutex_);
    wal_.close();
}

uint64_t KeyValueStore::last_sequence() const {
    std::lock_guard write_lock(write_mutex_);
    return wal_.next_sequence() - 1;
}

std::error_code KeyValueStore::log(const LogEntry& entry) {
    uint64_t sequence = 0;
    if (auto ec = wal_.append(entry, sequence)) {
        return ec;
    }
    spdlog::debug("Store: logged {} '{}' as sequence {}",
                  persistence::to_string(entry.operation()), entry.key(), sequence);
    return {};
}

// ── Recovery ─────────────────────────────────────────────────────────────────

std::error_code KeyValueStore::recover() {
    std::lock_guard write_lock(write_mutex_);

    std::unordered_map<std::string, std::string> rebuilt;
    uint64_t snapshot_sequence = 0;

    const auto snap_path = snapshot_path();
    if (Snapshot::exists(snap_path)) {
        persistence::SnapshotLoadResult snap;
        if (auto ec = Snapshot::load(snap_path, snap)) {
            spdlog::error("Store: failed to load snapshot: {}", ec.message());
            return ec;
        }
        rebuilt = std::move(snap.data);
        snapshot_sequence = snap.last_sequence;
    }

    std::vector<LogEntry> entries;
    if (auto ec = wal_.read_all(entries)) {
        spdlog::error("Store: failed to replay WAL: {}", ec.message());
        return ec;
    }

    // Entries after the snapshot must continue it without a gap.
    uint64_t expected = snapshot_sequence + 1;
    std::size_t replayed = 0;
    for (const auto& entry : entries) {
        if (entry.sequence() < expected) {
            continue;  // Already contained in the snapshot.
        }
        if (entry.sequence() != expected) {
            spdlog::error("Store: WAL jumps from sequence {} to {}",
                          expected - 1, entry.sequence());
            return std::make_error_code(std::errc::illegal_byte_sequence);
        }
        apply_entry(rebuilt, entry);
        ++expected;
        ++replayed;
    }

    if (wal_.is_open() && wal_.next_sequence() < expected) {
        spdlog::error("Store: WAL would reuse sequence {} (recovered through {})",
                      wal_.next_sequence(), expected - 1);
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }

    std::size_t key_count = rebuilt.size();
    {
        std::unique_lock map_lock(map_mutex_);
        map_ = std::move(rebuilt);
    }

    spdlog::info("Store: recovered {} keys (snapshot through {}, {} entries replayed)",
                 key_count, snapshot_sequence, replayed);
    return {};
}

// ── Mutations ────────────────────────────────────────────────────────────────

std::error_code KeyValueStore::put(std::string key, std::string value) {
    std::lock_guard write_lock(write_mutex_);

    if (auto ec = log(LogEntry::put(key, value))) {
        return ec;
    }

    std::unique_lock map_lock(map_mutex_);
    map_.insert_or_assign(std::move(key), std::move(value));
    return {};
}

std::error_code KeyValueStore::del(std::string_view key, bool* removed) {
    std::lock_guard write_lock(write_mutex_);

    if (auto ec = log(LogEntry::del(std::string(key)))) {
        return ec;
    }

    std::unique_lock map_lock(map_mutex_);
    const bool existed = map_.erase(std::string(key)) > 0;
    if (removed) {
        *removed = existed;
    }
    return {};
}

std::error_code KeyValueStore::checkpoint() {
    std::lock_guard write_lock(write_mutex_);

    if (auto ec = log(LogEntry::checkpoint())) {
        return ec;
    }
    // The marker is durable; an unsealed segment only delays the boundary
    // until the next rotation.
    if (auto ec = wal_.rotate()) {
        spdlog::warn("Store: checkpoint logged but segment not sealed: {}", ec.message());
    }
    return {};
}

std::error_code KeyValueStore::compact() {
    std::lock_guard write_lock(write_mutex_);

    if (!wal_.is_open()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    const uint64_t through = wal_.next_sequence() - 1;
    std::unordered_map<std::string, std::string> image;
    {
        std::shared_lock map_lock(map_mutex_);
        image = map_;
    }

    if (auto ec = Snapshot::save(snapshot_path(), image, through)) {
        return ec;
    }

    if (auto ec = wal_.rotate()) {
        return ec;
    }
    if (auto ec = wal_.remove_segments_through(through)) {
        return ec;
    }

    spdlog::info("Store: compacted {} keys through sequence {}", image.size(), through);
    return {};
}

// ── Reads ────────────────────────────────────────────────────────────────────

std::optional<std::string> KeyValueStore::get(std::string_view key) const {
    std::shared_lock lock(map_mutex_);
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> KeyValueStore::keys() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(map_mutex_);
        result.reserve(map_.size());
        for (const auto& [k, _] : map_) {
            result.push_back(k);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t KeyValueStore::size() const {
    std::shared_lock lock(map_mutex_);
    return map_.size();
}

std::unordered_map<std::string, std::string> KeyValueStore::snapshot() const {
    std::shared_lock lock(map_mutex_);
    return map_; // full copy under read lock
}

} // namespace walkv
