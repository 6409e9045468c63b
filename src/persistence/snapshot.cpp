#include "persistence/snapshot.hpp"
#include "persistence/codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace walkv::persistence {

namespace {

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read exactly `len` bytes from fd into `buf`. Returns error_code on failure.
[[nodiscard]] std::error_code read_exact(int fd, uint8_t* buf, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        auto n = ::read(fd, buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code corrupt() {
    return std::make_error_code(std::errc::illegal_byte_sequence);
}

}  // namespace

// ── Snapshot::save ───────────────────────────────────────────────────────────

std::error_code Snapshot::save(
    const std::filesystem::path& path,
    const std::unordered_map<std::string, std::string>& data,
    uint64_t last_sequence) {

    std::vector<uint8_t> buf;
    buf.reserve(kSnapshotHeaderSize + 8 + 4 + data.size() * 64 + 4);

    append_raw(buf, kSnapshotMagic, kSnapshotMagicSize);
    write_u16_le(buf, kSnapshotVersion);
    write_u64_le(buf, last_sequence);
    write_u32_le(buf, static_cast<uint32_t>(data.size()));

    // Entries: sorted by key for deterministic output.
    std::vector<std::pair<std::string, std::string>> sorted(data.begin(),
                                                            data.end());
    std::sort(sorted.begin(), sorted.end());

    for (const auto& [key, value] : sorted) {
        write_u32_le(buf, static_cast<uint32_t>(key.size()));
        append_raw(buf, key.data(), key.size());
        write_u32_le(buf, static_cast<uint32_t>(value.size()));
        append_raw(buf, value.data(), value.size());
    }

    // CRC32 of everything so far.
    uint32_t checksum = crc32(buf.data(), buf.size());
    write_u32_le(buf, checksum);

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("Snapshot: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    std::error_code rm_ec;
    auto ec = write_all(fd, buf.data(), buf.size());
    if (ec) {
        spdlog::error("Snapshot: write failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("Snapshot: fsync failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    ::close(fd);

    // Rename .tmp → final path.
    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("Snapshot: rename failed: {}", rename_ec.message());
        std::filesystem::remove(tmp_path, rm_ec);
        return rename_ec;
    }

    // Make the rename durable before callers drop the log it replaces.
    const auto dir = path.has_parent_path() ? path.parent_path()
                                            : std::filesystem::path{"."};
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0 || ::fsync(dir_fd) < 0) {
        ec = {errno, std::system_category()};
        if (dir_fd >= 0) ::close(dir_fd);
        spdlog::error("Snapshot: directory fsync failed: {}", ec.message());
        return ec;
    }
    ::close(dir_fd);

    spdlog::info("Snapshot: saved {} entries through sequence {} to {}",
                 data.size(), last_sequence, path.string());

    return {};
}

// ── Snapshot::load ───────────────────────────────────────────────────────────

std::error_code Snapshot::load(
    const std::filesystem::path& path,
    SnapshotLoadResult& result) {

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("Snapshot: failed to open {}: {}", path.string(),
                      ec.message());
        return ec;
    }

    auto file_size = ::lseek(fd, 0, SEEK_END);
    if (file_size < 0 || ::lseek(fd, 0, SEEK_SET) < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        ::close(fd);
        return ec;
    }

    // header(6) + last_sequence(8) + entry_count(4) + crc(4) = 22
    static constexpr std::size_t kMinSize = kSnapshotHeaderSize + 8 + 4 + 4;

    if (static_cast<std::size_t>(file_size) < kMinSize) {
        ::close(fd);
        spdlog::error("Snapshot: file too small ({} bytes)", file_size);
        return corrupt();
    }

    std::vector<uint8_t> buf(static_cast<std::size_t>(file_size));
    auto ec = read_exact(fd, buf.data(), buf.size());
    ::close(fd);
    if (ec) {
        spdlog::error("Snapshot: read failed: {}", ec.message());
        return ec;
    }

    // Check the CRC first: it covers everything but the last 4 bytes.
    const std::size_t data_len = buf.size() - 4;
    const uint8_t* crc_ptr = buf.data() + data_len;
    uint32_t stored_crc = 0;
    if (!read_u32_le(crc_ptr, buf.data() + buf.size(), stored_crc)) {
        return corrupt();
    }
    uint32_t computed_crc = crc32(buf.data(), data_len);
    if (stored_crc != computed_crc) {
        spdlog::error("Snapshot: CRC mismatch (stored={:#010x}, computed={:#010x})",
                      stored_crc, computed_crc);
        return corrupt();
    }

    const uint8_t* p = buf.data();
    const uint8_t* end = buf.data() + data_len;

    if (std::memcmp(p, kSnapshotMagic, kSnapshotMagicSize) != 0) {
        spdlog::error("Snapshot: invalid magic");
        return std::make_error_code(std::errc::invalid_argument);
    }
    p += kSnapshotMagicSize;

    uint16_t version = 0;
    if (!read_u16_le(p, end, version)) return corrupt();
    if (version != kSnapshotVersion) {
        spdlog::error("Snapshot: unsupported version {}", version);
        return std::make_error_code(std::errc::not_supported);
    }

    SnapshotLoadResult loaded;
    uint32_t entry_count = 0;
    if (!read_u64_le(p, end, loaded.last_sequence) ||
        !read_u32_le(p, end, entry_count)) {
        return corrupt();
    }

    loaded.data.reserve(entry_count);
    for (uint32_t i = 0; i < entry_count; ++i) {
        uint32_t key_len = 0;
        uint32_t val_len = 0;
        std::string key;
        std::string value;
        if (!read_u32_le(p, end, key_len) ||
            !read_string(p, end, key_len, key) ||
            !read_u32_le(p, end, val_len) ||
            !read_string(p, end, val_len, value)) {
            spdlog::error("Snapshot: truncated at entry {}", i);
            return corrupt();
        }
        loaded.data.emplace(std::move(key), std::move(value));
    }

    if (p != end) {
        spdlog::error("Snapshot: {} trailing bytes after entry {}", end - p, entry_count);
        return corrupt();
    }

    result = std::move(loaded);

    spdlog::info("Snapshot: loaded {} entries through sequence {} from {}",
                 result.data.size(), result.last_sequence, path.string());

    return {};
}

// ── Snapshot::exists ─────────────────────────────────────────────────────────

bool Snapshot::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace walkv::persistence
