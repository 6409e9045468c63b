#include "persistence/wal.hpp"
#include "persistence/codec.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace walkv::persistence {

namespace {

constexpr std::string_view kSegmentPrefix = "segment-";
constexpr std::string_view kSegmentSuffix = ".log";
constexpr std::size_t kSegmentIdDigits = 20;

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

// "segment-00000000000000000042.log" → 42. Returns false for foreign files.
bool parse_segment_filename(std::string_view name, uint64_t& first_sequence) {
    if (name.size() != kSegmentPrefix.size() + kSegmentIdDigits + kSegmentSuffix.size()) {
        return false;
    }
    if (name.substr(0, kSegmentPrefix.size()) != kSegmentPrefix) return false;
    if (name.substr(name.size() - kSegmentSuffix.size()) != kSegmentSuffix) return false;

    const auto digits = name.substr(kSegmentPrefix.size(), kSegmentIdDigits);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                     first_sequence);
    return ec == std::errc{} && ptr == digits.data() + digits.size();
}

std::vector<uint8_t> segment_header() {
    std::vector<uint8_t> hdr;
    hdr.reserve(kSegmentHeaderSize);
    append_raw(hdr, kSegmentMagic, kSegmentMagicSize);
    write_u16_le(hdr, kSegmentVersion);
    return hdr;
}

std::error_code validate_header(const uint8_t* data) {
    if (std::memcmp(data, kSegmentMagic, kSegmentMagicSize) != 0) {
        return make_error(std::errc::invalid_argument);
    }
    uint16_t version = static_cast<uint16_t>(data[5]) |
                       static_cast<uint16_t>(static_cast<uint16_t>(data[6]) << 8);
    if (version != kSegmentVersion) {
        return make_error(std::errc::not_supported);
    }
    return {};
}

std::error_code write_all(int fd, const std::vector<uint8_t>& data) {
    const uint8_t* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code read_file(const std::filesystem::path& path, std::vector<uint8_t>& data) {
    data.clear();
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    uint8_t buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        data.insert(data.end(), buf, buf + n);
    }
    ::close(fd);
    return {};
}

// Read and validate only the header of a sealed segment.
std::error_code check_sealed_header(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    uint8_t header[kSegmentHeaderSize];
    std::size_t got = 0;
    while (got < sizeof(header)) {
        auto n = ::read(fd, header + got, sizeof(header) - got);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        got += static_cast<std::size_t>(n);
    }
    ::close(fd);

    if (got < sizeof(header)) {
        return make_error(std::errc::invalid_argument);
    }
    return validate_header(header);
}

// Make file creation/removal in `dir` durable.
std::error_code sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return make_errno_error();
    }
    if (::fsync(fd) < 0) {
        auto ec = make_errno_error();
        ::close(fd);
        return ec;
    }
    ::close(fd);
    return {};
}

// True if a well-formed record with a sequence above `last_sequence` starts
// anywhere after the damaged record at `data`. The damaged length field
// cannot be trusted, so every offset is tried. Such a record means the
// damage is in the middle of the log, not a torn final write.
bool later_record_follows(const uint8_t* data, std::size_t size, uint64_t last_sequence) {
    for (std::size_t pos = 1; pos + kEntryHeaderSize + kEntryTrailerSize <= size; ++pos) {
        if (data[pos] != kLogEntryFormatVersion) continue;

        LogEntry entry;
        std::size_t consumed = 0;
        if (!LogEntry::decode(data + pos, size - pos, entry, consumed) &&
            entry.sequence() > last_sequence) {
            return true;
        }
    }
    return false;
}

struct SegmentScan {
    std::vector<LogEntry> entries;
    std::size_t valid_bytes = 0;  // End of the last well-formed record
    bool torn_tail = false;
};

// Decode one segment. Only the newest segment may end in a torn record.
std::error_code scan_segment(const Segment& segment, bool newest, SegmentScan& scan) {
    scan = {};

    std::vector<uint8_t> data;
    if (auto ec = read_file(segment.path, data)) {
        spdlog::error("WAL: cannot read {}: {}", segment.path.string(), ec.message());
        return ec;
    }

    if (data.size() < kSegmentHeaderSize) {
        if (newest) {
            // Crash while the segment was being created.
            spdlog::warn("WAL: {} has an incomplete header ({} bytes)",
                         segment.path.string(), data.size());
            scan.torn_tail = true;
            return {};
        }
        spdlog::error("WAL: sealed segment {} is too short", segment.path.string());
        return make_error(std::errc::invalid_argument);
    }

    if (auto ec = validate_header(data.data())) {
        spdlog::error("WAL: bad header in {}: {}", segment.path.string(), ec.message());
        return ec;
    }

    const uint8_t* base = data.data();
    std::size_t offset = kSegmentHeaderSize;
    scan.valid_bytes = offset;

    while (offset < data.size()) {
        LogEntry entry;
        std::size_t consumed = 0;
        const std::size_t remaining = data.size() - offset;
        auto ec = LogEntry::decode(base + offset, remaining, entry, consumed);

        if (!ec) {
            if (entry.sequence() < segment.first_sequence) {
                spdlog::error("WAL: entry {} precedes the first sequence {} of {}",
                              entry.sequence(), segment.first_sequence,
                              segment.path.string());
                return make_error(std::errc::illegal_byte_sequence);
            }
            scan.entries.push_back(std::move(entry));
            offset += consumed;
            scan.valid_bytes = offset;
            continue;
        }

        uint64_t last_sequence = segment.first_sequence > 0 ? segment.first_sequence - 1 : 0;
        if (!scan.entries.empty()) {
            last_sequence = scan.entries.back().sequence();
        }
        if (!newest || later_record_follows(base + offset, remaining, last_sequence)) {
            spdlog::error("WAL: corrupt entry in {} at offset {}: {}",
                          segment.path.string(), offset, ec.message());
            return make_error(std::errc::illegal_byte_sequence);
        }

        spdlog::warn("WAL: dropping torn record at offset {} of {} ({} bytes): {}",
                     offset, segment.path.string(), remaining, ec.message());
        scan.torn_tail = true;
        break;
    }

    return {};
}

// Cut a segment back to `length` bytes, rewriting the header if even that
// was incomplete.
std::error_code truncate_segment(const std::filesystem::path& path, std::size_t length) {
    int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    const bool rewrite_header = length < kSegmentHeaderSize;
    if (::ftruncate(fd, rewrite_header ? 0 : static_cast<off_t>(length)) < 0) {
        auto ec = make_errno_error();
        ::close(fd);
        return ec;
    }
    if (rewrite_header) {
        if (auto ec = write_all(fd, segment_header())) {
            ::close(fd);
            return ec;
        }
    }
    if (::fdatasync(fd) < 0) {
        auto ec = make_errno_error();
        ::close(fd);
        return ec;
    }
    ::close(fd);
    return {};
}

} // anonymous namespace

// ── WAL implementation ───────────────────────────────────────────────────────

WAL::WAL(WalOptions options) : options_(std::move(options)) {}

WAL::~WAL() {
    close();
}

std::string WAL::segment_filename(uint64_t first_sequence) {
    return fmt::format("{}{:020}{}", kSegmentPrefix, first_sequence, kSegmentSuffix);
}

std::error_code WAL::list_segments(std::vector<Segment>& segments) const {
    segments.clear();

    std::error_code ec;
    if (!std::filesystem::exists(options_.dir, ec)) {
        return ec;
    }

    for (std::filesystem::directory_iterator it(options_.dir, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        uint64_t first_sequence = 0;
        if (!parse_segment_filename(it->path().filename().string(), first_sequence)) {
            continue;
        }
        segments.push_back({first_sequence, it->path()});
    }
    if (ec) return ec;

    std::sort(segments.begin(), segments.end(),
              [](const Segment& a, const Segment& b) {
                  return a.first_sequence < b.first_sequence;
              });
    return {};
}

std::error_code WAL::open() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    if (options_.segment_size <= kSegmentHeaderSize) {
        spdlog::error("WAL: segment size {} does not exceed the {}-byte header",
                      options_.segment_size, kSegmentHeaderSize);
        return make_error(std::errc::invalid_argument);
    }
    if (options_.compression.level < kMinCompressionLevel ||
        options_.compression.level > kMaxCompressionLevel) {
        spdlog::error("WAL: compression level {} outside [{}, {}]",
                      options_.compression.level, kMinCompressionLevel, kMaxCompressionLevel);
        return make_error(std::errc::invalid_argument);
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.dir, ec);
    if (ec) return ec;

    std::vector<Segment> segments;
    if (ec = list_segments(segments); ec) return ec;

    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (ec = check_sealed_header(segments[i].path); ec) {
            spdlog::error("WAL: bad header in {}: {}",
                          segments[i].path.string(), ec.message());
            return ec;
        }
    }

    if (segments.empty()) {
        int fd = -1;
        if (ec = create_segment(1, fd); ec) return ec;

        fd_ = fd;
        current_ = {1, options_.dir / segment_filename(1)};
        current_size_ = kSegmentHeaderSize;
        current_entries_ = 0;
        next_sequence_ = 1;
        failed_ = false;
        spdlog::info("WAL: created {}", current_.path.string());
        return {};
    }

    const Segment& newest = segments.back();
    SegmentScan scan;
    if (ec = scan_segment(newest, true, scan); ec) return ec;

    if (scan.torn_tail) {
        if (ec = truncate_segment(newest.path, scan.valid_bytes); ec) {
            spdlog::error("WAL: cannot repair {}: {}", newest.path.string(), ec.message());
            return ec;
        }
        spdlog::warn("WAL: truncated {} to {} bytes",
                     newest.path.string(), std::max(scan.valid_bytes, kSegmentHeaderSize));
    }

    int fd = ::open(newest.path.c_str(), O_WRONLY | O_APPEND);
    if (fd < 0) {
        return make_errno_error();
    }

    fd_ = fd;
    current_ = newest;
    current_size_ = std::max(scan.valid_bytes, kSegmentHeaderSize);
    current_entries_ = scan.entries.size();
    next_sequence_ = scan.entries.empty() ? newest.first_sequence
                                          : scan.entries.back().sequence() + 1;
    failed_ = false;

    spdlog::info("WAL: opened {} ({} segments, next sequence {})",
                 current_.path.string(), segments.size(), next_sequence_);
    return {};
}

void WAL::close() {
    if (fd_ != -1) {
        if (::fdatasync(fd_) < 0) {
            spdlog::warn("WAL: fdatasync on close of {} failed: {}",
                         current_.path.string(), make_errno_error().message());
        }
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code WAL::create_segment(uint64_t first_sequence, int& fd) {
    const auto path = options_.dir / segment_filename(first_sequence);

    int new_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND, 0644);
    if (new_fd < 0) {
        return make_errno_error();
    }

    auto ec = write_all(new_fd, segment_header());
    if (!ec && ::fdatasync(new_fd) < 0) {
        ec = make_errno_error();
    }
    if (!ec) {
        ec = sync_directory(options_.dir);
    }
    if (ec) {
        ::close(new_fd);
        std::error_code rm_ec;
        std::filesystem::remove(path, rm_ec);
        return ec;
    }

    fd = new_fd;
    return {};
}

std::error_code WAL::write_bytes(const std::vector<uint8_t>& data) {
    if (auto ec = write_all(fd_, data)) {
        return ec;
    }

    // fsync to ensure durability.
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }

    return {};
}

void WAL::rollback() {
    if (::ftruncate(fd_, static_cast<off_t>(current_size_)) < 0 ||
        ::fdatasync(fd_) < 0) {
        spdlog::error("WAL: cannot roll {} back to {} bytes: {}; refusing further appends",
                      current_.path.string(), current_size_, make_errno_error().message());
        failed_ = true;
    }
}

std::error_code WAL::append(const LogEntry& entry, uint64_t& sequence) {
    if (fd_ == -1 || failed_) return make_error(std::errc::bad_file_descriptor);

    if (current_entries_ > 0 && current_size_ >= options_.segment_size) {
        if (auto ec = rotate()) return ec;
    }

    const LogEntry stamped = entry.with_sequence(next_sequence_);
    const auto data = stamped.encode(options_.compression);

    if (auto ec = write_bytes(data)) {
        spdlog::error("WAL: append of sequence {} to {} failed: {}",
                      next_sequence_, current_.path.string(), ec.message());
        rollback();
        return ec;
    }

    current_size_ += data.size();
    ++current_entries_;
    sequence = next_sequence_++;
    return {};
}

std::error_code WAL::rotate() {
    if (fd_ == -1 || failed_) return make_error(std::errc::bad_file_descriptor);
    if (current_entries_ == 0) return {};

    const uint64_t first_sequence = next_sequence_;
    int fd = -1;
    if (auto ec = create_segment(first_sequence, fd)) {
        spdlog::error("WAL: cannot create segment {}: {}",
                      segment_filename(first_sequence), ec.message());
        return ec;
    }

    // Every append was already fdatasync'ed; the old segment is sealed.
    ::close(fd_);

    const auto sealed = current_.path.filename().string();
    fd_ = fd;
    current_ = {first_sequence, options_.dir / segment_filename(first_sequence)};
    current_size_ = kSegmentHeaderSize;
    current_entries_ = 0;

    spdlog::info("WAL: sealed {}, appending to {}",
                 sealed, current_.path.filename().string());
    return {};
}

std::error_code WAL::remove_segments_through(uint64_t sequence) {
    std::vector<Segment> segments;
    if (auto ec = list_segments(segments)) return ec;

    std::size_t removed = 0;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        const Segment& segment = segments[i];
        if (fd_ != -1 && segment.path == current_.path) break;

        // The next segment's first sequence bounds this one's entries.
        const uint64_t last_in_segment = segments[i + 1].first_sequence - 1;
        if (last_in_segment > sequence) break;

        std::error_code ec;
        std::filesystem::remove(segment.path, ec);
        if (ec) {
            spdlog::error("WAL: cannot remove {}: {}", segment.path.string(), ec.message());
            return ec;
        }
        ++removed;
    }

    if (removed > 0) {
        if (auto ec = sync_directory(options_.dir)) return ec;
        spdlog::info("WAL: removed {} segments covering sequences <= {}", removed, sequence);
    }
    return {};
}

std::error_code WAL::read_all(std::vector<LogEntry>& entries) const {
    entries.clear();

    std::vector<Segment> segments;
    if (auto ec = list_segments(segments)) return ec;

    uint64_t last_sequence = 0;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        SegmentScan scan;
        if (auto ec = scan_segment(segments[i], i + 1 == segments.size(), scan)) {
            return ec;
        }

        for (auto& entry : scan.entries) {
            if (entry.sequence() <= last_sequence) {
                spdlog::error("WAL: sequence {} follows {} in {}",
                              entry.sequence(), last_sequence,
                              segments[i].path.string());
                return make_error(std::errc::illegal_byte_sequence);
            }
            last_sequence = entry.sequence();
            entries.push_back(std::move(entry));
        }
    }

    return {};
}

} // namespace walkv::persistence
