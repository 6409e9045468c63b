#pragma once

#include "persistence/compression.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace walkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one walkv-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string host;          // Bind address for client connections
    uint16_t    port;          // Port for client (text protocol) connections
    std::string data_dir;      // Directory for WAL segments and the snapshot
    uint64_t    segment_size;  // WAL rotation threshold in bytes
    persistence::Compression compression;  // Body encoding of new WAL records
    int         compression_level;         // zlib level, 0..9
    unsigned    threads;       // io_context worker threads
    std::string log_level;     // spdlog level string
};

// Smallest accepted --segment-size.
static constexpr uint64_t kMinSegmentSize = 1024;

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message. For
//             --help the message is the option summary.
//
// Validates:
//   - port in [1, 65535]
//   - data_dir not empty
//   - segment_size >= kMinSegmentSize
//   - compression is "none" or "zlib", compression_level in [0, 9]
//   - threads >= 1

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with walkv-server
// options. Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace walkv
