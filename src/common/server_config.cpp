#include "common/server_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace walkv {

namespace {

// Validate that a port number is in [1, 65535].
void validate_port(uint16_t port, std::string_view field_name) {
    if (port == 0) {
        throw std::runtime_error(
            fmt::format("Port for {} must be in [1, 65535], got 0", field_name));
    }
    // uint16_t max is 65535 by definition – no upper bound check needed.
}

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    validate_port(cfg.port, "--port");

    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }
    if (cfg.segment_size < kMinSegmentSize) {
        throw std::runtime_error(
            fmt::format("--segment-size must be at least {} bytes, got {}",
                        kMinSegmentSize, cfg.segment_size));
    }
    if (cfg.compression_level < persistence::kMinCompressionLevel ||
        cfg.compression_level > persistence::kMaxCompressionLevel) {
        throw std::runtime_error(
            fmt::format("--compression-level must be in [{}, {}], got {}",
                        persistence::kMinCompressionLevel,
                        persistence::kMaxCompressionLevel, cfg.compression_level));
    }
    if (cfg.threads == 0) {
        throw std::runtime_error("--threads must be at least 1");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for client connections")
        ("port",
            po::value<uint16_t>()->default_value(6380),
            "Port for client (text protocol) connections")
        ("data-dir",
            po::value<std::string>()->default_value("./data"),
            "Directory for WAL segments and the snapshot")
        ("segment-size",
            po::value<uint64_t>()->default_value(10 * 1024 * 1024),
            "WAL segment rotation threshold in bytes")
        ("compression",
            po::value<std::string>()->default_value("zlib"),
            "WAL record compression: none|zlib")
        ("compression-level",
            po::value<int>()->default_value(persistence::kDefaultCompressionLevel),
            "zlib compression level (0-9)")
        ("threads",
            po::value<unsigned>()->default_value(4),
            "Worker threads serving client connections")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("walkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        // Handle --help before notify() so option errors don't mask it.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host         = vm["host"].as<std::string>();
    cfg.port         = vm["port"].as<uint16_t>();
    cfg.data_dir     = vm["data-dir"].as<std::string>();
    cfg.segment_size = vm["segment-size"].as<uint64_t>();
    cfg.log_level    = vm["log-level"].as<std::string>();
    cfg.threads      = vm["threads"].as<unsigned>();
    cfg.compression_level = vm["compression-level"].as<int>();

    const auto compression = vm["compression"].as<std::string>();
    if (!persistence::parse_compression(compression, cfg.compression)) {
        throw std::runtime_error(
            fmt::format("--compression must be 'none' or 'zlib', got '{}'", compression));
    }

    validate(cfg);
    return cfg;
}

} // namespace walkv
