#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace walkv::persistence {

// ── CRC32 ────────────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Little-endian writers ────────────────────────────────────────────────────

void write_u8(std::vector<uint8_t>& buf, uint8_t v);
void write_u16_le(std::vector<uint8_t>& buf, uint16_t v);
void write_u32_le(std::vector<uint8_t>& buf, uint32_t v);
void write_u64_le(std::vector<uint8_t>& buf, uint64_t v);
void write_i64_le(std::vector<uint8_t>& buf, int64_t v);
void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len);

// ── Bounds-checked readers ───────────────────────────────────────────────────
//
// Each reader advances `ptr` on success and returns false (leaving `ptr`
// untouched) if fewer than the required bytes remain before `end`.

[[nodiscard]] bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out);
[[nodiscard]] bool read_u16_le(const uint8_t*& ptr, const uint8_t* end, uint16_t& out);
[[nodiscard]] bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out);
[[nodiscard]] bool read_u64_le(const uint8_t*& ptr, const uint8_t* end, uint64_t& out);
[[nodiscard]] bool read_i64_le(const uint8_t*& ptr, const uint8_t* end, int64_t& out);
[[nodiscard]] bool read_string(const uint8_t*& ptr, const uint8_t* end,
                               std::size_t len, std::string& out);

} // namespace walkv::persistence
