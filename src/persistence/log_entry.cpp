#include "persistence/log_entry.hpp"
#include "persistence/codec.hpp"

#include <utility>

namespace walkv::persistence {

namespace {

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

bool is_known_operation(uint8_t op) {
    return op == static_cast<uint8_t>(Operation::Put) ||
           op == static_cast<uint8_t>(Operation::Delete) ||
           op == static_cast<uint8_t>(Operation::Checkpoint);
}

} // anonymous namespace

std::string_view to_string(Operation op) noexcept {
    switch (op) {
        case Operation::Put:        return "PUT";
        case Operation::Delete:     return "DELETE";
        case Operation::Checkpoint: return "CHECKPOINT";
    }
    return "UNKNOWN";
}

// ── Construction ─────────────────────────────────────────────────────────────

LogEntry::LogEntry(uint64_t sequence, Operation operation, std::string key,
                   std::string value, Timestamp timestamp)
    : sequence_(sequence),
      operation_(operation),
      key_(std::move(key)),
      value_(std::move(value)),
      timestamp_(timestamp) {}

LogEntry::Timestamp LogEntry::now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

LogEntry LogEntry::put(std::string key, std::string value) {
    return LogEntry{0, Operation::Put, std::move(key), std::move(value), now()};
}

LogEntry LogEntry::del(std::string key) {
    return LogEntry{0, Operation::Delete, std::move(key), {}, now()};
}

LogEntry LogEntry::checkpoint() {
    return LogEntry{0, Operation::Checkpoint, {}, {}, now()};
}

LogEntry LogEntry::with_sequence(uint64_t sequence) const {
    return LogEntry{sequence, operation_, key_, value_, timestamp_};
}

// ── Encoding ─────────────────────────────────────────────────────────────────

std::vector<uint8_t> LogEntry::encode(const CompressionOptions& compression) const {
    std::vector<uint8_t> body;
    body.reserve(4 + key_.size() + 4 + value_.size());
    write_u32_le(body, static_cast<uint32_t>(key_.size()));
    append_raw(body, key_.data(), key_.size());
    write_u32_le(body, static_cast<uint32_t>(value_.size()));
    append_raw(body, value_.data(), value_.size());

    Compression stored = Compression::None;
    if (compression.type == Compression::Zlib) {
        std::vector<uint8_t> deflated;
        if (!zlib_compress(body.data(), body.size(), compression.level, deflated) &&
            4 + deflated.size() < body.size()) {
            std::vector<uint8_t> packed;
            packed.reserve(4 + deflated.size());
            write_u32_le(packed, static_cast<uint32_t>(body.size()));
            append_raw(packed, deflated.data(), deflated.size());
            body = std::move(packed);
            stored = Compression::Zlib;
        }
    }

    const auto payload_length = static_cast<uint32_t>(kEntryBodyOffset + body.size());

    std::vector<uint8_t> buf;
    buf.reserve(kEntryHeaderSize + payload_length + kEntryTrailerSize);

    write_u8(buf, kLogEntryFormatVersion);
    write_u32_le(buf, payload_length);
    write_u64_le(buf, sequence_);
    write_u8(buf, static_cast<uint8_t>(operation_));
    write_i64_le(buf, timestamp_.time_since_epoch().count());
    write_u8(buf, static_cast<uint8_t>(stored));
    append_raw(buf, body.data(), body.size());

    // CRC covers format_version through body, as stored.
    uint32_t c = crc32(buf.data(), buf.size());
    write_u32_le(buf, c);

    return buf;
}

// ── Decoding ─────────────────────────────────────────────────────────────────

bool LogEntry::framed_size(const uint8_t* data, std::size_t size,
                           std::size_t& out) noexcept {
    const uint8_t* ptr = data;
    const uint8_t* end = data + size;

    uint8_t version = 0;
    uint32_t payload_length = 0;
    if (!read_u8(ptr, end, version)) return false;
    if (version != kLogEntryFormatVersion) return false;
    if (!read_u32_le(ptr, end, payload_length)) return false;

    out = kEntryHeaderSize + payload_length + kEntryTrailerSize;
    return true;
}

std::error_code LogEntry::decode(const uint8_t* data, std::size_t size,
                                 LogEntry& out, std::size_t& consumed) {
    const uint8_t* ptr = data;
    const uint8_t* end = data + size;

    uint8_t version = 0;
    uint32_t payload_length = 0;
    if (!read_u8(ptr, end, version) || !read_u32_le(ptr, end, payload_length)) {
        return make_error(std::errc::message_size);
    }
    if (version != kLogEntryFormatVersion) {
        return make_error(std::errc::illegal_byte_sequence);
    }
    if (payload_length < kEntryBodyOffset) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    const std::size_t total = kEntryHeaderSize + payload_length + kEntryTrailerSize;
    if (size < total) {
        return make_error(std::errc::message_size);
    }

    // Verify the CRC before trusting any field.
    const uint8_t* crc_ptr = data + kEntryHeaderSize + payload_length;
    uint32_t stored_crc = 0;
    if (!read_u32_le(crc_ptr, end, stored_crc)) {
        return make_error(std::errc::message_size);
    }
    if (crc32(data, kEntryHeaderSize + payload_length) != stored_crc) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    // Parse the payload strictly within its declared bounds.
    const uint8_t* payload_end = data + kEntryHeaderSize + payload_length;

    uint64_t sequence = 0;
    uint8_t op = 0;
    int64_t timestamp_us = 0;
    uint8_t compression = 0;

    if (!read_u64_le(ptr, payload_end, sequence) ||
        !read_u8(ptr, payload_end, op) ||
        !read_i64_le(ptr, payload_end, timestamp_us) ||
        !read_u8(ptr, payload_end, compression)) {
        return make_error(std::errc::illegal_byte_sequence);
    }
    if (!is_known_compression(compression)) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    // Inflate a compressed body, then parse both kinds the same way.
    std::vector<uint8_t> inflated;
    const uint8_t* body = ptr;
    const uint8_t* body_end = payload_end;
    if (static_cast<Compression>(compression) == Compression::Zlib) {
        uint32_t raw_length = 0;
        if (!read_u32_le(ptr, payload_end, raw_length)) {
            return make_error(std::errc::illegal_byte_sequence);
        }
        if (auto ec = zlib_decompress(ptr, static_cast<std::size_t>(payload_end - ptr),
                                      raw_length, inflated)) {
            return ec;
        }
        body = inflated.data();
        body_end = inflated.data() + inflated.size();
    }

    uint32_t key_length = 0;
    uint32_t value_length = 0;
    std::string key;
    std::string value;

    if (!read_u32_le(body, body_end, key_length) ||
        !read_string(body, body_end, key_length, key) ||
        !read_u32_le(body, body_end, value_length) ||
        !read_string(body, body_end, value_length, value)) {
        return make_error(std::errc::illegal_byte_sequence);
    }
    if (body != body_end) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    if (!is_known_operation(op)) {
        return make_error(std::errc::illegal_byte_sequence);
    }
    const auto operation = static_cast<Operation>(op);
    if (operation == Operation::Checkpoint && (!key.empty() || !value.empty())) {
        return make_error(std::errc::illegal_byte_sequence);
    }
    if (operation == Operation::Delete && !value.empty()) {
        return make_error(std::errc::illegal_byte_sequence);
    }

    out = LogEntry{sequence, operation, std::move(key), std::move(value),
                   Timestamp{std::chrono::microseconds{timestamp_us}}};
    consumed = total;
    return {};
}

} // namespace walkv::persistence
