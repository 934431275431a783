/**
 * @file protocol.cpp
 * @brief JSON-RPC codec and line framing
 */

#include "klip/protocol.h"
#include "klip/validator.h"

#include <exception>
#include <memory>
#include <string>

namespace klip {

namespace {

const Json::StreamWriterBuilder &writer_builder() {
  static const Json::StreamWriterBuilder builder = [] {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return b;
  }();
  return builder;
}

Json::Value envelope(const Json::Value &id) {
  Json::Value message(Json::objectValue);
  message["jsonrpc"] = JSONRPC_VERSION;
  message["id"] = id;
  return message;
}

bool is_valid_id(const Json::Value &id) {
  return id.isNull() || id.isString() || id.isNumeric();
}

} // namespace

// ============================================================================
// Decoding
// ============================================================================

Result<Json::Value> parse_message(const std::string &frame) {
  if (!is_valid_utf8(frame)) {
    return Error(ErrorCode::ParseError, "Parse error: message is not valid UTF-8");
  }

  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  // Scalars parse; to_request rejects them as InvalidRequest
  builder.settings_["strictRoot"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  bool ok;
  try {
    ok = reader->parse(frame.data(), frame.data() + frame.size(), &root,
                       &errors);
  } catch (const std::exception &e) {
    ok = false;
    errors = e.what();
  }

  if (!ok) {
    while (!errors.empty() && (errors.back() == '\n' || errors.back() == ' ')) {
      errors.pop_back();
    }
    return Error(ErrorCode::ParseError, "Parse error", errors);
  }

  return root;
}

Result<RpcRequest> to_request(const Json::Value &message) {
  if (!message.isObject()) {
    return Error(ErrorCode::InvalidRequest,
                 "Invalid request: message must be a JSON object");
  }

  const Json::Value &version = message["jsonrpc"];
  if (!version.isNull() &&
      !(version.isString() && version.asString() == JSONRPC_VERSION)) {
    return Error(ErrorCode::InvalidRequest,
                 "Invalid request: jsonrpc must be \"2.0\"");
  }

  const Json::Value &method = message["method"];
  if (!method.isString()) {
    return Error(ErrorCode::InvalidRequest,
                 "Invalid request: method must be a string");
  }

  RpcRequest request;
  request.is_notification = !message.isMember("id");
  if (!request.is_notification) {
    request.id = message["id"];
    if (!is_valid_id(request.id)) {
      return Error(ErrorCode::InvalidRequest,
                   "Invalid request: id must be a string, number or null");
    }
  }

  request.method = method.asString();

  const Json::Value &params = message["params"];
  if (!params.isNull() && !params.isObject() && !params.isArray()) {
    return Error(ErrorCode::InvalidRequest,
                 "Invalid request: params must be an object or array");
  }
  request.params = params;

  return request;
}

Json::Value recover_id(const Json::Value &message) {
  if (message.isObject()) {
    const Json::Value &id = message["id"];
    if (id.isString() || id.isNumeric()) {
      return id;
    }
  }
  return Json::Value::nullSingleton();
}

// ============================================================================
// Encoding
// ============================================================================

std::string encode_result(const Json::Value &id, const Json::Value &result) {
  Json::Value message = envelope(id);
  message["result"] = result;
  return Json::writeString(writer_builder(), message);
}

std::string encode_error(const Json::Value &id, int code,
                         const std::string &message) {
  Json::Value response = envelope(id);
  response["error"]["code"] = code;
  response["error"]["message"] = message;
  return Json::writeString(writer_builder(), response);
}

std::string encode_error(const Json::Value &id, const Error &error) {
  std::string message = error.message.empty()
                            ? std::string(error_code_description(error.code))
                            : error.message;
  return encode_error(id, jsonrpc_error_code(error.code), message);
}

int jsonrpc_error_code(ErrorCode code) {
  switch (code) {
  case ErrorCode::ParseError:
    return JSONRPC_PARSE_ERROR;
  case ErrorCode::InvalidRequest:
  case ErrorCode::MessageTooLarge:
    return JSONRPC_INVALID_REQUEST;
  case ErrorCode::MethodNotFound:
    return JSONRPC_METHOD_NOT_FOUND;
  case ErrorCode::ToolNotFound:
  case ErrorCode::InvalidParameters:
    return JSONRPC_INVALID_PARAMS;
  default:
    break;
  }

  if (is_validation_error(code) || is_clipboard_error(code)) {
    return JSONRPC_SERVER_ERROR;
  }
  return JSONRPC_INTERNAL_ERROR;
}

Json::Value text_content(const std::string &text) {
  Json::Value block(Json::objectValue);
  block["type"] = "text";
  block["text"] = text;

  Json::Value result(Json::objectValue);
  result["content"].append(block);
  result["isError"] = false;
  return result;
}

// ============================================================================
// Framing
// ============================================================================

FrameStatus read_frame(std::istream &in, size_t max_bytes, std::string &frame) {
  using traits = std::char_traits<char>;

  frame.clear();
  std::streambuf *sb = in.rdbuf();
  if (sb == nullptr) {
    return FrameStatus::EndOfStream;
  }

  bool any = false;
  bool overflow = false;
  for (;;) {
    traits::int_type c = sb->sbumpc();
    if (traits::eq_int_type(c, traits::eof())) {
      in.setstate(std::ios::eofbit);
      if (!any) {
        return FrameStatus::EndOfStream;
      }
      break;
    }

    any = true;
    if (c == '\n') {
      break;
    }

    // One byte of slack for a CRLF terminator
    if (frame.size() <= max_bytes) {
      frame.push_back(traits::to_char_type(c));
    } else {
      overflow = true;
    }
  }

  if (!overflow && !frame.empty() && frame.back() == '\r') {
    frame.pop_back();
  }

  if (overflow || frame.size() > max_bytes) {
    frame.clear();
    return FrameStatus::TooLarge;
  }
  return FrameStatus::Ok;
}

bool write_frame(std::ostream &out, const std::string &frame) {
  out << frame << '\n';
  out.flush();
  return static_cast<bool>(out);
}

} // namespace klip
