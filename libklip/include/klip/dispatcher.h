/**
 * @file dispatcher.h
 * @brief Tool catalog and dispatch
 *
 * Maps a tool invocation onto the validator and the clipboard gateway,
 * and packages every outcome, including every failure, as a ToolResult.
 */

#ifndef KLIP_DISPATCHER_H
#define KLIP_DISPATCHER_H

#include "clipboard.h"
#include "config.h"
#include "error.h"
#include "platform.h"
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace klip {

// ============================================================================
// Tool Names
// ============================================================================

constexpr const char *TOOL_CLIPBOARD_SET = "clipboard_set";
constexpr const char *TOOL_COPY_TO_CLIPBOARD = "copy_to_clipboard";
constexpr const char *TOOL_CLIPBOARD_GET = "clipboard_get";

/**
 * @brief Enumerated tool set
 */
enum class ToolKind : uint8_t {
  /// Write text to the clipboard (also answers to copy_to_clipboard)
  ClipboardSet = 0,

  /// Read text from the clipboard
  ClipboardGet = 1
};

/// Get the canonical name for a tool
KLIP_API const char *tool_kind_name(ToolKind kind);

/// Resolve a tool name or alias
KLIP_API std::optional<ToolKind> parse_tool_name(const std::string &name);

// ============================================================================
// Request / Result
// ============================================================================

/**
 * @brief One tool invocation
 */
struct ToolRequest {
  /// Caller's correlation token (string, number or null)
  Json::Value id;

  /// Tool name as sent by the caller
  std::string name;

  /// Tool arguments; null is treated as an empty object
  Json::Value arguments;
};

/**
 * @brief Outcome of a tool invocation
 *
 * Success carries the human-readable payload ("Successfully copied 13
 * characters to clipboard", or the clipboard text for clipboard_get).
 */
using ToolResult = Result<std::string>;

/**
 * @brief Catalog entry surfaced through tools/list
 */
struct ToolInfo {
  std::string name;
  std::string description;
  Json::Value input_schema;
};

// ============================================================================
// Tool Dispatcher
// ============================================================================

/**
 * @brief Routes tool invocations to the clipboard
 *
 * dispatch() never throws and never leaves a request unanswered.
 */
class KLIP_API ToolDispatcher {
public:
  ToolDispatcher(ClipboardGateway &gateway, const ServerConfig &config);

  /// Run one tool invocation
  ToolResult dispatch(const ToolRequest &request);

  /// Enabled tools, in catalog order
  std::vector<ToolInfo> tools() const;

  /// Check if @p name resolves to an enabled tool
  bool has_tool(const std::string &name) const;

private:
  std::optional<ToolKind> resolve(const std::string &name) const;
  ToolResult handle_set(const Json::Value &arguments);
  ToolResult handle_get();

  ClipboardGateway &gateway_;
  size_t max_text_bytes_;
  bool enable_get_;
};

} // namespace klip

#endif // KLIP_DISPATCHER_H
