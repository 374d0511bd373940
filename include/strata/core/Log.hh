#pragma once

// Strata Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "strata/core/Log.hh"
//   STRATA_LOG_INFO("Palette built with {} entries", count);
//   STRATA_LOG_RENDER_WARN("Draw rejected: {}", reason);

// Neutralize X11 macro pollution. <X11/X.h> defines bare-word macros that
// collide with Quill's enum member names (e.g. Always, None, Never).
#ifdef Always
#undef Always
#endif
#ifdef None
#undef None
#endif
#ifdef Never
#undef Never
#endif
#ifdef Bool
#undef Bool
#endif
#ifdef Status
#undef Status
#endif
#ifdef Success
#undef Success
#endif
#ifdef True
#undef True
#endif
#ifdef False
#undef False
#endif

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <optional>
#include <string_view>

namespace strata::log {

/// Initialize the logging subsystem (console + per-subsystem files under logs/).
/// Call once at startup before any logging.
void init();

/// Initialize with an extra caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Root logger. Valid after init().
quill::Logger* logger();

/// Subsystem loggers. Fall back to the root logger if not created.
quill::Logger* renderLogger();
quill::Logger* terrainLogger();

/// Runtime level of each logger (within the compile-time ceiling).
struct LogLevels {
    quill::LogLevel root = quill::LogLevel::Info;
    quill::LogLevel render = quill::LogLevel::Info;
    quill::LogLevel terrain = quill::LogLevel::Info;
};

void applyLevels(const LogLevels& levels);
LogLevels currentLevels();

/// Maps "trace", "debug", "info", "warning" (or "warn"), "error" and
/// "critical" to a level. Case-sensitive; anything else is nullopt.
std::optional<quill::LogLevel> levelFromName(std::string_view name);

} // namespace strata::log

// Strata logging macros - wrap Quill with the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define STRATA_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(strata::log::logger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(strata::log::logger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_INFO(fmt, ...) QUILL_LOG_INFO(strata::log::logger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(strata::log::logger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(strata::log::logger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(strata::log::logger(), fmt, ##__VA_ARGS__)

// Render subsystem
#define STRATA_LOG_RENDER_DEBUG(fmt, ...) QUILL_LOG_DEBUG(strata::log::renderLogger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_RENDER_INFO(fmt, ...) QUILL_LOG_INFO(strata::log::renderLogger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_RENDER_WARN(fmt, ...) QUILL_LOG_WARNING(strata::log::renderLogger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_RENDER_ERROR(fmt, ...) QUILL_LOG_ERROR(strata::log::renderLogger(), fmt, ##__VA_ARGS__)

// Terrain subsystem
#define STRATA_LOG_TERRAIN_DEBUG(fmt, ...) QUILL_LOG_DEBUG(strata::log::terrainLogger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_TERRAIN_INFO(fmt, ...) QUILL_LOG_INFO(strata::log::terrainLogger(), fmt, ##__VA_ARGS__)
#define STRATA_LOG_TERRAIN_WARN(fmt, ...) QUILL_LOG_WARNING(strata::log::terrainLogger(), fmt, ##__VA_ARGS__)
