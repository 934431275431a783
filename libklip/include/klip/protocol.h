/**
 * @file protocol.h
 * @brief JSON-RPC 2.0 message codec and stdio framing
 *
 * One JSON message per line in each direction, as used by the MCP stdio
 * transport. Output is raw UTF-8, compact, newline-terminated.
 */

#ifndef KLIP_PROTOCOL_H
#define KLIP_PROTOCOL_H

#include "error.h"
#include "platform.h"
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

#include <json/json.h>

namespace klip {

// ============================================================================
// Protocol Constants
// ============================================================================

/// JSON-RPC version tag
constexpr const char *JSONRPC_VERSION = "2.0";

/// MCP protocol revision answered when the client does not name one
constexpr const char *MCP_PROTOCOL_VERSION = "2024-11-05";

// JSON-RPC error codes
constexpr int JSONRPC_PARSE_ERROR = -32700;
constexpr int JSONRPC_INVALID_REQUEST = -32600;
constexpr int JSONRPC_METHOD_NOT_FOUND = -32601;
constexpr int JSONRPC_INVALID_PARAMS = -32602;
constexpr int JSONRPC_INTERNAL_ERROR = -32603;

/// Code for every validation and clipboard failure
constexpr int JSONRPC_SERVER_ERROR = -32000;

// MCP methods
constexpr const char *METHOD_INITIALIZE = "initialize";
constexpr const char *METHOD_PING = "ping";
constexpr const char *METHOD_TOOLS_LIST = "tools/list";
constexpr const char *METHOD_TOOLS_CALL = "tools/call";
constexpr const char *NOTIFICATION_PREFIX = "notifications/";

// ============================================================================
// Messages
// ============================================================================

/**
 * @brief Decoded inbound message
 */
struct RpcRequest {
  /// Correlation id; null for notifications
  Json::Value id;

  std::string method;

  /// Parameters; null when absent
  Json::Value params;

  /// Messages without an "id" member get no response
  bool is_notification = false;
};

/**
 * @brief Parse one frame as JSON
 * @return ParseError for invalid UTF-8 or malformed JSON
 */
KLIP_API Result<Json::Value> parse_message(const std::string &frame);

/**
 * @brief Interpret a parsed JSON value as a request
 * @return InvalidRequest if it is not an object, or method is missing or
 *         not a string, or id has a type JSON-RPC does not allow
 */
KLIP_API Result<RpcRequest> to_request(const Json::Value &message);

/**
 * @brief Best-effort id recovery for an invalid request
 * @return The message's id if it is a string or number, else null
 */
KLIP_API Json::Value recover_id(const Json::Value &message);

/// Serialize a success response (no trailing newline)
KLIP_API std::string encode_result(const Json::Value &id,
                                   const Json::Value &result);

/// Serialize an error response (no trailing newline)
KLIP_API std::string encode_error(const Json::Value &id, int code,
                                  const std::string &message);

/// Serialize an error response using the code mapped from @p error
KLIP_API std::string encode_error(const Json::Value &id, const Error &error);

/**
 * @brief JSON-RPC error code for a klip error
 *
 * Validation and clipboard failures map to -32000; ToolNotFound and
 * InvalidParameters to -32602; protocol errors to their standard codes.
 */
KLIP_API int jsonrpc_error_code(ErrorCode code);

/**
 * @brief MCP tool result with a single text content block
 * @return {"content":[{"type":"text","text":...}],"isError":false}
 */
KLIP_API Json::Value text_content(const std::string &text);

// ============================================================================
// Framing
// ============================================================================

enum class FrameStatus : uint8_t {
  /// A complete frame was read
  Ok = 0,

  /// The frame exceeded the size cap and was discarded up to its newline
  TooLarge = 1,

  /// End of input before any byte of a new frame
  EndOfStream = 2
};

/**
 * @brief Read one newline-terminated frame
 * @param in Input stream
 * @param max_bytes Size cap; longer frames are skipped, not buffered
 * @param frame Receives the frame without its newline (and trailing '\r')
 *
 * A final frame without a newline is still returned as Ok.
 */
KLIP_API FrameStatus read_frame(std::istream &in, size_t max_bytes,
                                std::string &frame);

/**
 * @brief Write one frame followed by a newline and flush
 * @return false if the stream is no longer writable
 */
KLIP_API bool write_frame(std::ostream &out, const std::string &frame);

} // namespace klip

#endif // KLIP_PROTOCOL_H
