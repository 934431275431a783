/**
 * @file clipboard_linux.h
 * @brief Linux clipboard types and internal declarations
 *
 * Internal types for X11/Wayland clipboard access through the
 * wl-clipboard, xclip and xsel command-line tools.
 */

#ifndef KLIP_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define KLIP_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "klip/clipboard.h"
#include "klip/config.h"
#include "klip/error.h"
#include <chrono>
#include <string>
#include <vector>

namespace klip {
namespace platform {

/**
 * @brief Display server the clipboard lives on
 */
enum class DisplayServer { None, X11, Wayland };

/// Get name for display server ("none", "x11", "wayland")
const char *display_server_name(DisplayServer server);

/**
 * @brief Detect the current display server from the environment
 *
 * WAYLAND_DISPLAY wins over DISPLAY (XWayland sessions set both).
 */
DisplayServer detect_display_server();

/**
 * @brief Resolved command lines for one clipboard tool family
 */
struct ClipboardCommands {
  /// Tool family name for logs ("wl-clipboard", "xclip", "xsel")
  std::string tool;

  /// Writes stdin to the clipboard
  std::vector<std::string> copy_argv;

  /// Prints the clipboard text to stdout
  std::vector<std::string> paste_argv;
};

/**
 * @brief Find the clipboard tools for a display server
 * @return Commands with absolute executable paths, or ClipboardUnavailable
 *         naming the package to install
 */
Result<ClipboardCommands> resolve_clipboard_commands(DisplayServer server);

/**
 * @brief Clipboard backend that shells out to a clipboard tool
 *
 * Each call spawns the tool with the operation timeout as its deadline;
 * an expired tool is killed so the gateway worker is never wedged.
 */
class CommandClipboard : public ClipboardBackend {
public:
  CommandClipboard(ClipboardCommands commands,
                   std::chrono::milliseconds timeout);

  std::string name() const override;
  Result<void> set_text(const std::string &text) override;
  Result<std::string> get_text() override;

private:
  ClipboardCommands commands_;
  std::chrono::milliseconds timeout_;
};

} // namespace platform
} // namespace klip

#endif // KLIP_PLATFORM_LINUX_CLIPBOARD_LINUX_H
