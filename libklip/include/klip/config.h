/**
 * @file config.h
 * @brief Server configuration for klip
 *
 * Configuration is read from the environment once at startup and treated
 * as immutable for the lifetime of the process.
 */

#ifndef KLIP_CONFIG_H
#define KLIP_CONFIG_H

#include "error.h"
#include "log.h"
#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace klip {

// ============================================================================
// Defaults
// ============================================================================

/// Maximum clipboard text size in bytes (10 MiB)
constexpr size_t DEFAULT_MAX_TEXT_BYTES = 10 * 1024 * 1024;

/// Per-operation clipboard timeout
constexpr std::chrono::seconds DEFAULT_OPERATION_TIMEOUT{5};

/// Upper bound accepted for the operation timeout
constexpr std::chrono::seconds MAX_OPERATION_TIMEOUT{3600};

/// Maximum size of one inbound protocol frame (64 MiB)
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 64 * 1024 * 1024;

// Environment variable names
constexpr const char *ENV_MAX_TEXT_BYTES = "KLIP_MAX_TEXT_BYTES";
constexpr const char *ENV_TIMEOUT_SECS = "KLIP_TIMEOUT_SECS";
constexpr const char *ENV_MAX_MESSAGE_BYTES = "KLIP_MAX_MESSAGE_BYTES";
constexpr const char *ENV_ENABLE_GET = "KLIP_ENABLE_GET";
constexpr const char *ENV_CLIPBOARD_BACKEND = "KLIP_CLIPBOARD_BACKEND";
constexpr const char *ENV_LOG = "KLIP_LOG";

// ============================================================================
// Backend Selection
// ============================================================================

/**
 * @brief Which clipboard backend to bind at startup
 */
enum class BackendPreference : uint8_t {
  /// Detect from WAYLAND_DISPLAY / DISPLAY
  Auto = 0,

  /// wl-clipboard (wl-copy / wl-paste)
  Wayland = 1,

  /// xclip or xsel
  X11 = 2
};

/// Get lowercase name for backend preference
KLIP_API const char *backend_preference_name(BackendPreference pref);

// ============================================================================
// Server Configuration
// ============================================================================

/**
 * @brief Complete configuration for the klip server
 */
struct ServerConfig {
  /// Largest text accepted by the set tool, in bytes
  size_t max_text_bytes = DEFAULT_MAX_TEXT_BYTES;

  /// Budget for a single clipboard operation
  std::chrono::milliseconds operation_timeout = DEFAULT_OPERATION_TIMEOUT;

  /// Largest inbound frame accepted before JSON parsing
  size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES;

  /// Expose the clipboard_get tool
  bool enable_get_tool = true;

  /// Clipboard backend to bind
  BackendPreference backend = BackendPreference::Auto;

  /// Log threshold
  LogLevel log_level = LogLevel::Info;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /**
   * @brief Override fields from KLIP_* environment variables
   * @return Error naming the variable if a value cannot be parsed
   *
   * Unset or empty variables keep the current value.
   */
  Result<void> load_from_env();

  /// Validate configuration
  Result<void> validate() const;

  /// Build a configuration from defaults plus environment
  static Result<ServerConfig> from_env();
};

} // namespace klip

#endif // KLIP_CONFIG_H
