#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace walkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by every component (store, WAL,
// server, CLI). Safe to call more than once; later calls only change the
// level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named logger sharing the default
// pattern, e.g. one per client session.
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace walkv
