/**
 * @file error.h
 * @brief Error codes and result types for klip
 *
 * klip uses a Result type pattern for error handling. Every failure,
 * from a rejected payload to a missing display server, travels back to
 * the dispatcher as a value and is turned into a protocol response there.
 */

#ifndef KLIP_ERROR_H
#define KLIP_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace klip {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,

  // Validation errors (100-199)
  TextTooLarge = 100,
  InvalidUtf8 = 101,
  EmptyText = 102, // Reserved: empty text is currently accepted

  // Clipboard errors (200-299)
  ClipboardUnavailable = 200,
  PermissionDenied = 201,
  OperationTimeout = 202,
  NoTextContent = 203,
  PlatformError = 204,

  // Dispatch errors (300-399)
  ToolNotFound = 300,
  InvalidParameters = 301,

  // Protocol errors (400-499)
  ParseError = 400,
  InvalidRequest = 401,
  MethodNotFound = 402,
  MessageTooLarge = 403
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 *
 * `message` is the caller-visible text; `details` keeps raw platform
 * output (tool stderr, errno text) for the log.
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string (for logs)
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<std::string> text = gateway.get();
 *   if (text) {
 *       use(text.value());
 *   } else {
 *       log_warn("{}", text.error().to_string());
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return !error_.has_value(); }

  /// Check if result is error
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the error
  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define KLIP_TRY(result)                                                       \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define KLIP_REQUIRE(condition, error_code, message)                           \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::klip::Error(error_code, message);                               \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
KLIP_API const char *error_code_name(ErrorCode code);

/// Get description for error code
KLIP_API const char *error_code_description(ErrorCode code);

/// Check if retrying the failed operation may succeed
KLIP_API bool is_recoverable(ErrorCode code);

/// Check if error code belongs to the clipboard taxonomy (200-299)
KLIP_API bool is_clipboard_error(ErrorCode code);

/// Check if error code belongs to the validation taxonomy (100-199)
KLIP_API bool is_validation_error(ErrorCode code);

} // namespace klip

#endif // KLIP_ERROR_H
