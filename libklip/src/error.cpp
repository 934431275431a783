/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "klip/error.h"
#include <sstream>

namespace klip {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";

  case ErrorCode::TextTooLarge:
    return "TextTooLarge";
  case ErrorCode::InvalidUtf8:
    return "InvalidUtf8";
  case ErrorCode::EmptyText:
    return "EmptyText";

  case ErrorCode::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::OperationTimeout:
    return "OperationTimeout";
  case ErrorCode::NoTextContent:
    return "NoTextContent";
  case ErrorCode::PlatformError:
    return "PlatformError";

  case ErrorCode::ToolNotFound:
    return "ToolNotFound";
  case ErrorCode::InvalidParameters:
    return "InvalidParameters";

  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::InvalidRequest:
    return "InvalidRequest";
  case ErrorCode::MethodNotFound:
    return "MethodNotFound";
  case ErrorCode::MessageTooLarge:
    return "MessageTooLarge";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";

  case ErrorCode::TextTooLarge:
    return "Text exceeds the maximum clipboard size";
  case ErrorCode::InvalidUtf8:
    return "Text is not valid UTF-8";
  case ErrorCode::EmptyText:
    return "Text is empty";

  case ErrorCode::ClipboardUnavailable:
    return "Clipboard is unavailable";
  case ErrorCode::PermissionDenied:
    return "Permission denied accessing the clipboard";
  case ErrorCode::OperationTimeout:
    return "Clipboard operation timed out";
  case ErrorCode::NoTextContent:
    return "Clipboard contains non-text data";
  case ErrorCode::PlatformError:
    return "Clipboard platform error";

  case ErrorCode::ToolNotFound:
    return "Tool not found";
  case ErrorCode::InvalidParameters:
    return "Invalid parameters";

  case ErrorCode::ParseError:
    return "Parse error";
  case ErrorCode::InvalidRequest:
    return "Invalid request";
  case ErrorCode::MethodNotFound:
    return "Method not found";
  case ErrorCode::MessageTooLarge:
    return "Message too large";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Classification
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // No display server or clipboard tool; retrying will not help
  case ErrorCode::ClipboardUnavailable:
    return false;

  default:
    return true;
  }
}

bool is_clipboard_error(ErrorCode code) {
  int value = static_cast<int>(code);
  return value >= 200 && value < 300;
}

bool is_validation_error(ErrorCode code) {
  int value = static_cast<int>(code);
  return value >= 100 && value < 200;
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace klip
