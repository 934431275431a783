/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "klip/config.h"

namespace klip {

// ============================================================================
// Helpers
// ============================================================================

namespace {

/// Returns nullptr for unset or empty variables
const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return nullptr;
  }
  return value;
}

Result<uint64_t> parse_unsigned(const char *name, const char *text) {
  // strtoull accepts a leading '-', reject it explicitly
  for (const char *p = text; *p != '\0'; ++p) {
    if (!std::isdigit(static_cast<unsigned char>(*p))) {
      return Error(ErrorCode::InvalidArgument,
                   std::string(name) + " must be a non-negative integer, got '" +
                       text + "'");
    }
  }

  errno = 0;
  char *end = nullptr;
  unsigned long long value = std::strtoull(text, &end, 10);
  if (errno == ERANGE || end == text || *end != '\0') {
    return Error(ErrorCode::InvalidArgument,
                 std::string(name) + " is out of range: '" + text + "'");
  }
  return static_cast<uint64_t>(value);
}

Result<bool> parse_bool(const char *name, const char *text) {
  std::string lower;
  for (const char *p = text; *p != '\0'; ++p) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(*p)));
  }

  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  return Error(ErrorCode::InvalidArgument,
               std::string(name) + " must be a boolean, got '" + text + "'");
}

} // namespace

const char *backend_preference_name(BackendPreference pref) {
  switch (pref) {
  case BackendPreference::Auto:
    return "auto";
  case BackendPreference::Wayland:
    return "wayland";
  case BackendPreference::X11:
    return "x11";
  default:
    return "unknown";
  }
}

// ============================================================================
// ServerConfig Methods
// ============================================================================

void ServerConfig::load_defaults() {
  max_text_bytes = DEFAULT_MAX_TEXT_BYTES;
  operation_timeout = DEFAULT_OPERATION_TIMEOUT;
  max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;
  enable_get_tool = true;
  backend = BackendPreference::Auto;
  log_level = LogLevel::Info;
}

Result<void> ServerConfig::load_from_env() {
  if (const char *text = env_value(ENV_MAX_TEXT_BYTES)) {
    auto value = parse_unsigned(ENV_MAX_TEXT_BYTES, text);
    KLIP_TRY(value);
    max_text_bytes = static_cast<size_t>(value.value());
  }

  if (const char *text = env_value(ENV_TIMEOUT_SECS)) {
    auto value = parse_unsigned(ENV_TIMEOUT_SECS, text);
    KLIP_TRY(value);
    // Checked here: larger values overflow the conversion to milliseconds
    if (value.value() > static_cast<uint64_t>(MAX_OPERATION_TIMEOUT.count())) {
      return Error(ErrorCode::InvalidArgument,
                   std::string(ENV_TIMEOUT_SECS) + " must be at most " +
                       std::to_string(MAX_OPERATION_TIMEOUT.count()) +
                       ", got '" + text + "'");
    }
    operation_timeout = std::chrono::seconds(value.value());
  }

  if (const char *text = env_value(ENV_MAX_MESSAGE_BYTES)) {
    auto value = parse_unsigned(ENV_MAX_MESSAGE_BYTES, text);
    KLIP_TRY(value);
    max_message_bytes = static_cast<size_t>(value.value());
  }

  if (const char *text = env_value(ENV_ENABLE_GET)) {
    auto value = parse_bool(ENV_ENABLE_GET, text);
    KLIP_TRY(value);
    enable_get_tool = value.value();
  }

  if (const char *text = env_value(ENV_CLIPBOARD_BACKEND)) {
    std::string name = text;
    if (name == "auto") {
      backend = BackendPreference::Auto;
    } else if (name == "wayland") {
      backend = BackendPreference::Wayland;
    } else if (name == "x11") {
      backend = BackendPreference::X11;
    } else {
      return Error(ErrorCode::InvalidArgument,
                   std::string(ENV_CLIPBOARD_BACKEND) +
                       " must be one of auto, wayland, x11, got '" + name + "'");
    }
  }

  if (const char *text = env_value(ENV_LOG)) {
    auto level = parse_log_level(text);
    if (!level) {
      return Error(ErrorCode::InvalidArgument,
                   std::string(ENV_LOG) +
                       " must be one of debug, info, warn, error, off, got '" +
                       text + "'");
    }
    log_level = *level;
  }

  return Result<void>::ok();
}

Result<void> ServerConfig::validate() const {
  if (max_text_bytes == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Maximum text size must be greater than zero");
  }

  if (operation_timeout.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Operation timeout must be at least one second");
  }

  if (operation_timeout > MAX_OPERATION_TIMEOUT) {
    return Error(ErrorCode::InvalidArgument,
                 "Operation timeout must be at most " +
                     std::to_string(MAX_OPERATION_TIMEOUT.count()) +
                     " seconds");
  }

  // A frame must be able to carry a maximum-size text plus its envelope
  if (max_message_bytes <= max_text_bytes) {
    return Error(ErrorCode::InvalidArgument,
                 "Maximum message size must exceed the maximum text size");
  }

  return Result<void>::ok();
}

Result<ServerConfig> ServerConfig::from_env() {
  ServerConfig config;
  config.load_defaults();

  KLIP_TRY(config.load_from_env());
  KLIP_TRY(config.validate());

  return config;
}

} // namespace klip
