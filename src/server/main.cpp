#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/kv_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    walkv::ServerConfig cfg;
    try {
        cfg = walkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = walkv::parse_log_level(cfg.log_level);
    walkv::init_default_logger(level);
    auto logger = walkv::make_logger("walkv-server", level);

    logger->info("walkv-server starting – listen={}:{} data_dir={} segment_size={} "
                 "compression={} (level {}) threads={}",
        cfg.host, cfg.port, cfg.data_dir, cfg.segment_size,
        walkv::persistence::to_string(cfg.compression), cfg.compression_level, cfg.threads);

    // ── Data directory ───────────────────────────────────────────────────────
    namespace fs = std::filesystem;
    const fs::path data_dir{cfg.data_dir};
    std::error_code fs_ec;
    fs::create_directories(data_dir, fs_ec);
    if (fs_ec) {
        logger->error("Failed to create data directory {}: {}",
                      data_dir.string(), fs_ec.message());
        return 1;
    }

    // ── Store: open WAL → load snapshot → replay → ready ─────────────────────
    walkv::KeyValueStore store{walkv::StoreOptions{
        data_dir, cfg.segment_size, {cfg.compression, cfg.compression_level}}};

    if (auto ec = store.open()) {
        logger->error("Failed to open WAL under {}: {}", data_dir.string(), ec.message());
        return 1;
    }
    if (auto ec = store.recover()) {
        logger->error("Recovery failed: {}", ec.message());
        return 1;
    }
    logger->info("Recovered {} keys through sequence {}",
                 store.size(), store.last_sequence());

    // ── Serve ────────────────────────────────────────────────────────────────
    try {
        walkv::network::Server server{cfg.host, cfg.port, store, cfg.threads};
        server.run();
    } catch (const std::exception& ex) {
        logger->error("Server error: {}", ex.what());
        store.close();
        return 1;
    }

    store.close();
    logger->info("walkv-server stopped");
    return 0;
}
