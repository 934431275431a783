/**
 * @file clipboard_platform_linux.cpp
 * @brief Clipboard platform hooks for Linux
 *
 * Implements the platform hooks declared in clipboard_pimpl.h using
 * X11/Wayland clipboard tools.
 */

#include "../../clipboard_pimpl.h"
#include "clipboard_linux.h"
#include "klip/log.h"

#include <memory>

namespace klip {

// ============================================================================
// Platform Hook Implementations
// ============================================================================

namespace {

platform::DisplayServer select_display_server(BackendPreference pref) {
  switch (pref) {
  case BackendPreference::Wayland:
    return platform::DisplayServer::Wayland;
  case BackendPreference::X11:
    return platform::DisplayServer::X11;
  default:
    return platform::detect_display_server();
  }
}

} // namespace

Result<std::unique_ptr<ClipboardBackend>>
platform_open_clipboard(const ServerConfig &config) {
  using namespace platform;

  DisplayServer server = select_display_server(config.backend);
  log_debug("clipboard backend preference {}, display server {}",
            backend_preference_name(config.backend),
            display_server_name(server));

  auto commands = resolve_clipboard_commands(server);
  if (commands.is_error()) {
    return commands.error();
  }

  log_info("using {} clipboard on {}", commands.value().tool,
           display_server_name(server));

  std::unique_ptr<ClipboardBackend> backend =
      std::make_unique<CommandClipboard>(std::move(commands).value(),
                                         config.operation_timeout);
  return Result<std::unique_ptr<ClipboardBackend>>(std::move(backend));
}

bool platform_clipboard_available() {
  using namespace platform;

  return resolve_clipboard_commands(detect_display_server()).is_ok();
}

} // namespace klip
