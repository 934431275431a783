/**
 * @file log.h
 * @brief Leveled logging for klip
 *
 * All log output goes to standard error. Standard output carries the
 * protocol stream and must never see a log line.
 */

#ifndef KLIP_LOG_H
#define KLIP_LOG_H

#include "platform.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace klip {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Get lowercase name for log level ("debug", "info", ...)
KLIP_API const char *log_level_name(LogLevel level);

/// Parse a level name (case-insensitive); "warning" is accepted for Warn
KLIP_API std::optional<LogLevel> parse_log_level(std::string_view name);

/// Set the process-wide threshold
KLIP_API void set_log_level(LogLevel level);

/// Get the process-wide threshold
KLIP_API LogLevel log_level();

/// Check if a message at @p level would be written
KLIP_API bool log_enabled(LogLevel level);

namespace detail {
KLIP_API void write_log(LogLevel level, const std::string &message);
} // namespace detail

// ============================================================================
// Logging Functions
// ============================================================================

template <typename... Args>
void log_error(const std::string_view fmt, Args &&...args) noexcept {
  if (log_enabled(LogLevel::Error))
    detail::write_log(LogLevel::Error,
                      fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(const std::string_view fmt, Args &&...args) noexcept {
  if (log_enabled(LogLevel::Warn))
    detail::write_log(LogLevel::Warn,
                      fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(const std::string_view fmt, Args &&...args) noexcept {
  if (log_enabled(LogLevel::Info))
    detail::write_log(LogLevel::Info,
                      fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(const std::string_view fmt, Args &&...args) noexcept {
  if (log_enabled(LogLevel::Debug))
    detail::write_log(LogLevel::Debug,
                      fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
}

} // namespace klip

#endif // KLIP_LOG_H
