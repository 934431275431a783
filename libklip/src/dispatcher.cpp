/**
 * @file dispatcher.cpp
 * @brief Tool dispatch implementation
 */

#include "klip/dispatcher.h"
#include "klip/log.h"
#include "klip/validator.h"

#include <exception>

namespace klip {

// ============================================================================
// Tool Names
// ============================================================================

const char *tool_kind_name(ToolKind kind) {
  switch (kind) {
  case ToolKind::ClipboardSet:
    return TOOL_CLIPBOARD_SET;
  case ToolKind::ClipboardGet:
    return TOOL_CLIPBOARD_GET;
  default:
    return "unknown";
  }
}

std::optional<ToolKind> parse_tool_name(const std::string &name) {
  if (name == TOOL_CLIPBOARD_SET || name == TOOL_COPY_TO_CLIPBOARD) {
    return ToolKind::ClipboardSet;
  }
  if (name == TOOL_CLIPBOARD_GET) {
    return ToolKind::ClipboardGet;
  }
  return std::nullopt;
}

// ============================================================================
// ToolDispatcher
// ============================================================================

ToolDispatcher::ToolDispatcher(ClipboardGateway &gateway,
                               const ServerConfig &config)
    : gateway_(gateway), max_text_bytes_(config.max_text_bytes),
      enable_get_(config.enable_get_tool) {}

std::optional<ToolKind> ToolDispatcher::resolve(const std::string &name) const {
  auto kind = parse_tool_name(name);
  if (kind == ToolKind::ClipboardGet && !enable_get_) {
    return std::nullopt;
  }
  return kind;
}

bool ToolDispatcher::has_tool(const std::string &name) const {
  return resolve(name).has_value();
}

std::vector<ToolInfo> ToolDispatcher::tools() const {
  std::vector<ToolInfo> catalog;

  ToolInfo set;
  set.name = TOOL_CLIPBOARD_SET;
  set.description = "Copy text to the system clipboard";
  set.input_schema["type"] = "object";
  set.input_schema["properties"]["text"]["type"] = "string";
  set.input_schema["properties"]["text"]["description"] =
      "The text content to copy to the clipboard";
  set.input_schema["required"].append("text");
  catalog.push_back(std::move(set));

  if (enable_get_) {
    ToolInfo get;
    get.name = TOOL_CLIPBOARD_GET;
    get.description = "Read the current text content of the system clipboard";
    get.input_schema["type"] = "object";
    get.input_schema["properties"] = Json::Value(Json::objectValue);
    catalog.push_back(std::move(get));
  }

  return catalog;
}

ToolResult ToolDispatcher::dispatch(const ToolRequest &request) {
  auto kind = resolve(request.name);
  if (!kind) {
    log_warn("unknown tool '{}'", request.name);
    return Error(ErrorCode::ToolNotFound, "Tool not found: " + request.name);
  }

  ToolResult result = Error(ErrorCode::Unknown);
  try {
    switch (*kind) {
    case ToolKind::ClipboardSet:
      result = handle_set(request.arguments);
      break;
    case ToolKind::ClipboardGet:
      result = handle_get();
      break;
    }
  } catch (const std::exception &e) {
    result = Error(ErrorCode::Unknown,
                   std::string("Internal error: ") + e.what());
  }

  if (result.is_error()) {
    log_warn("{} failed: {}", tool_kind_name(*kind), result.error().to_string());
  } else {
    log_debug("{} succeeded", tool_kind_name(*kind));
  }
  return result;
}

ToolResult ToolDispatcher::handle_set(const Json::Value &arguments) {
  if (!arguments.isNull() && !arguments.isObject()) {
    return Error(ErrorCode::InvalidParameters,
                 "Invalid parameters: arguments must be an object");
  }

  const Json::Value &text_value = arguments.isObject()
                                      ? arguments["text"]
                                      : Json::Value::nullSingleton();
  if (text_value.isNull()) {
    return Error(ErrorCode::InvalidParameters,
                 "Invalid parameters: missing required field 'text'");
  }
  if (!text_value.isString()) {
    return Error(ErrorCode::InvalidParameters,
                 "Invalid parameters: field 'text' must be a string");
  }

  std::string text = text_value.asString();

  auto valid = validate_text(text, max_text_bytes_);
  if (valid.is_error()) {
    return valid.error();
  }

  auto written = gateway_.set(text);
  if (written.is_error()) {
    return written.error();
  }

  return "Successfully copied " + std::to_string(count_scalar_values(text)) +
         " characters to clipboard";
}

ToolResult ToolDispatcher::handle_get() {
  auto text = gateway_.get();
  if (text.is_error()) {
    return text.error();
  }
  return std::move(text).value();
}

} // namespace klip
