/**
 * @file log.cpp
 * @brief Logging backend (stderr)
 */

#include "klip/log.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <unistd.h>

#include <fmt/chrono.h>
#include <fmt/color.h>

namespace klip {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_write_mutex;

fmt::text_style level_style(LogLevel level) {
  switch (level) {
  case LogLevel::Error:
    return fmt::emphasis::bold | fmt::fg(fmt::color::red);
  case LogLevel::Warn:
    return fmt::emphasis::bold | fmt::fg(fmt::color::yellow);
  case LogLevel::Info:
    return fmt::emphasis::bold | fmt::fg(fmt::color::cyan);
  default:
    return fmt::emphasis::bold | fmt::fg(fmt::color::hot_pink);
  }
}

} // namespace

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  case LogLevel::Off:
    return "off";
  default:
    return "unknown";
  }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lower == "debug" || lower == "trace")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "off" || lower == "none")
    return LogLevel::Off;
  return std::nullopt;
}

void set_log_level(LogLevel level) { g_level.store(level); }

LogLevel log_level() { return g_level.load(); }

bool log_enabled(LogLevel level) {
  LogLevel threshold = g_level.load();
  return threshold != LogLevel::Off && level >= threshold;
}

namespace detail {

void write_log(LogLevel level, const std::string &message) {
  static const bool colored = isatty(fileno(stderr)) != 0;

  std::string tag = log_level_name(level);
  for (auto &c : tag) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  std::lock_guard<std::mutex> lock(g_write_mutex);
  auto now = std::chrono::system_clock::now();
  if (colored) {
    fmt::print(stderr, level_style(level), "[{}] {}: {}\n", now, tag, message);
  } else {
    fmt::print(stderr, "[{}] {}: {}\n", now, tag, message);
  }
  std::fflush(stderr);
}

} // namespace detail

} // namespace klip
