#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace labelmap {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger "labelmap" (tool startup messages,
// tests).  Call once at program start before any logging; later calls only
// adjust the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g.
// "bench" or "storage.dynamictiled".  Lines carry the name as [<name>].
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

// True if `s` is one of the strings parse_log_level() recognises.
bool is_log_level(const std::string& s);

} // namespace labelmap
