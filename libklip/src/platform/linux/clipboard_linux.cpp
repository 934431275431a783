/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard implementation
 *
 * Implements clipboard access using command-line tools (wl-copy, xclip,
 * xsel) for maximum compatibility across different Linux environments.
 */

#include "clipboard_linux.h"
#include "command_runner.h"
#include "klip/log.h"
#include "klip/validator.h"

#include <cstdlib>
#include <optional>

namespace klip {
namespace platform {

// ============================================================================
// Display Server Detection
// ============================================================================

const char *display_server_name(DisplayServer server) {
  switch (server) {
  case DisplayServer::None:
    return "none";
  case DisplayServer::X11:
    return "x11";
  case DisplayServer::Wayland:
    return "wayland";
  default:
    return "unknown";
  }
}

DisplayServer detect_display_server() {
  // Check for Wayland
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && wayland[0] != '\0') {
    return DisplayServer::Wayland;
  }

  // Check for X11
  const char *display = std::getenv("DISPLAY");
  if (display && display[0] != '\0') {
    return DisplayServer::X11;
  }

  // Headless or unknown
  return DisplayServer::None;
}

// ============================================================================
// Tool Resolution
// ============================================================================

Result<ClipboardCommands> resolve_clipboard_commands(DisplayServer server) {
  if (server == DisplayServer::Wayland) {
    auto copy = find_executable("wl-copy");
    auto paste = find_executable("wl-paste");
    if (!copy || !paste) {
      return Error(ErrorCode::ClipboardUnavailable,
                   "Clipboard unavailable: wl-copy/wl-paste not found. "
                   "Install the wl-clipboard package.");
    }
    return ClipboardCommands{
        "wl-clipboard",
        {*copy, "--type", "text/plain;charset=utf-8"},
        {*paste, "--no-newline", "--type", "text"}};
  }

  if (server == DisplayServer::X11) {
    if (auto xclip = find_executable("xclip")) {
      return ClipboardCommands{
          "xclip",
          {*xclip, "-selection", "clipboard", "-in"},
          {*xclip, "-selection", "clipboard", "-out", "-target",
           "UTF8_STRING"}};
    }
    if (auto xsel = find_executable("xsel")) {
      return ClipboardCommands{"xsel",
                               {*xsel, "--clipboard", "--input"},
                               {*xsel, "--clipboard", "--output"}};
    }
    return Error(ErrorCode::ClipboardUnavailable,
                 "Clipboard unavailable: xclip or xsel not found. "
                 "Install one of them.");
  }

  return Error(ErrorCode::ClipboardUnavailable,
               "Clipboard unavailable: no display server detected "
               "(WAYLAND_DISPLAY and DISPLAY are unset)");
}

// ============================================================================
// CommandClipboard
// ============================================================================

CommandClipboard::CommandClipboard(ClipboardCommands commands,
                                   std::chrono::milliseconds timeout)
    : commands_(std::move(commands)), timeout_(timeout) {}

std::string CommandClipboard::name() const { return commands_.tool; }

Result<void> CommandClipboard::set_text(const std::string &text) {
  // stdout goes to /dev/null: xclip and wl-copy leave a daemon behind that
  // would otherwise hold the pipe open
  auto run = run_command(commands_.copy_argv, text, timeout_, false);
  if (run.is_error()) {
    return run.error();
  }

  const auto &result = run.value();
  if (!result.succeeded()) {
    return classify_clipboard_failure(ClipboardOperation::Set,
                                      result.failure_text(commands_.tool));
  }

  log_debug("{} accepted {} bytes", commands_.tool, text.size());
  return Result<void>::ok();
}

Result<std::string> CommandClipboard::get_text() {
  auto run = run_command(commands_.paste_argv, "", timeout_, true);
  if (run.is_error()) {
    return run.error();
  }

  auto &result = run.value();
  if (!result.succeeded()) {
    return classify_clipboard_failure(ClipboardOperation::Get,
                                      result.failure_text(commands_.tool));
  }

  if (!is_valid_utf8(result.output)) {
    return Error(ErrorCode::NoTextContent, "Clipboard contains non-text data",
                 "clipboard bytes are not valid UTF-8");
  }

  return std::move(result.output);
}

} // namespace platform
} // namespace klip
