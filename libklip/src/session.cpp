/**
 * @file session.cpp
 * @brief Session loop implementation
 */

#include "klip/session.h"
#include "klip/klip.h"
#include "klip/log.h"

#include <exception>

namespace klip {

// ============================================================================
// Session State Names
// ============================================================================

const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::AwaitingMessage:
    return "AwaitingMessage";
  case SessionState::Dispatching:
    return "Dispatching";
  case SessionState::Closed:
    return "Closed";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Session State Machine
// ============================================================================

const std::map<SessionState, std::set<SessionState>>
    SessionStateMachine::valid_transitions_ = {
        // AwaitingMessage -> Dispatching, Closed
        {SessionState::AwaitingMessage,
         {SessionState::Dispatching, SessionState::Closed}},

        // Dispatching -> AwaitingMessage
        {SessionState::Dispatching, {SessionState::AwaitingMessage}},

        // Terminal
        {SessionState::Closed, {}}};

SessionStateMachine::SessionStateMachine()
    : state_(SessionState::AwaitingMessage) {}

SessionState SessionStateMachine::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

Result<void> SessionStateMachine::transition(SessionState to) {
  SessionState from;
  StateChangedCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = valid_transitions_.find(state_);
    if (it == valid_transitions_.end() ||
        it->second.find(to) == it->second.end()) {
      return Error(ErrorCode::InvalidArgument,
                   std::string("Invalid transition: ") +
                       session_state_name(state_) + " -> " +
                       session_state_name(to));
    }

    from = state_;
    state_ = to;
    callback = state_changed_cb_;
  }

  if (callback) {
    callback(from, to);
  }
  return Result<void>::ok();
}

bool SessionStateMachine::can_transition(SessionState to) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  return it != valid_transitions_.end() && it->second.count(to) > 0;
}

std::set<SessionState> SessionStateMachine::valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = valid_transitions_.find(state_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

bool SessionStateMachine::is_terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::Closed;
}

void SessionStateMachine::on_state_changed(StateChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_changed_cb_ = std::move(callback);
}

// ============================================================================
// Session
// ============================================================================

Session::Session(ToolDispatcher &dispatcher, const ServerConfig &config,
                 std::istream &in, std::ostream &out)
    : dispatcher_(dispatcher), max_message_bytes_(config.max_message_bytes),
      in_(in), out_(out) {}

SessionState Session::state() const { return state_.current(); }

void Session::enter(SessionState to) {
  auto moved = state_.transition(to);
  if (moved.is_error()) {
    log_error("session state: {}", moved.error().message);
  }
}

Result<void> Session::run() {
  std::string frame;

  while (!state_.is_terminal()) {
    std::optional<std::string> response;

    switch (read_frame(in_, max_message_bytes_, frame)) {
    case FrameStatus::EndOfStream:
      log_info("input closed after {} responses, shutting down",
               responses_sent_);
      KLIP_TRY(state_.transition(SessionState::Closed));
      continue;

    case FrameStatus::TooLarge:
      log_warn("discarded inbound message larger than {} bytes",
               max_message_bytes_);
      response = encode_error(
          Json::Value::nullSingleton(),
          Error(ErrorCode::MessageTooLarge,
                "Message too large: limit is " +
                    std::to_string(max_message_bytes_) + " bytes"));
      break;

    case FrameStatus::Ok:
      response = handle_frame(frame);
      break;
    }

    if (response) {
      if (!write_frame(out_, *response)) {
        log_warn("output stream closed, shutting down");
        KLIP_TRY(state_.transition(SessionState::Closed));
        continue;
      }
      ++responses_sent_;
    }
  }

  return Result<void>::ok();
}

std::optional<std::string> Session::handle_frame(const std::string &frame) {
  if (frame.find_first_not_of(" \t\r") == std::string::npos) {
    return std::nullopt;
  }

  auto message = parse_message(frame);
  if (message.is_error()) {
    log_warn("rejecting inbound message: {}", message.error().to_string());
    return encode_error(Json::Value::nullSingleton(), message.error());
  }

  auto request = to_request(message.value());
  if (request.is_error()) {
    log_warn("rejecting inbound message: {}", request.error().to_string());
    return encode_error(recover_id(message.value()), request.error());
  }

  enter(SessionState::Dispatching);

  std::optional<std::string> response;
  try {
    response = handle_request(request.value());
  } catch (const std::exception &e) {
    log_error("internal error handling {}: {}", request.value().method,
              e.what());
    if (!request.value().is_notification) {
      response = encode_error(request.value().id, JSONRPC_INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what());
    }
  }

  enter(SessionState::AwaitingMessage);
  return response;
}

std::optional<std::string> Session::handle_request(const RpcRequest &request) {
  const std::string &method = request.method;
  log_debug("<- {}", method);

  if (request.is_notification) {
    // notifications/initialized, notifications/cancelled, ...: nothing to say
    if (method.rfind(NOTIFICATION_PREFIX, 0) != 0) {
      log_debug("ignoring notification {}", method);
    }
    return std::nullopt;
  }

  if (method == METHOD_INITIALIZE) {
    initialized_ = true;
    return encode_result(request.id, initialize_result(request.params));
  }

  if (method == METHOD_PING) {
    return encode_result(request.id, Json::Value(Json::objectValue));
  }

  if (method == METHOD_TOOLS_LIST) {
    return encode_result(request.id, tools_list_result());
  }

  if (method == METHOD_TOOLS_CALL) {
    const Json::Value &params = request.params;
    if (!params.isObject() || !params["name"].isString()) {
      return encode_error(request.id,
                          Error(ErrorCode::InvalidParameters,
                                "Invalid parameters: tools/call requires a "
                                "string 'name'"));
    }
    return call_tool(request.id, params["name"].asString(),
                     params["arguments"]);
  }

  // Direct invocation: the method is the tool name
  if (dispatcher_.has_tool(method)) {
    return call_tool(request.id, method, request.params);
  }

  return encode_error(request.id,
                      Error(ErrorCode::MethodNotFound,
                            "Method not found: " + method));
}

std::optional<std::string> Session::call_tool(const Json::Value &id,
                                              const std::string &name,
                                              const Json::Value &arguments) {
  ToolRequest request;
  request.id = id;
  request.name = name;
  request.arguments = arguments;

  ToolResult result = dispatcher_.dispatch(request);
  if (result.is_error()) {
    return encode_error(id, result.error());
  }
  return encode_result(id, text_content(result.value()));
}

Json::Value Session::initialize_result(const Json::Value &params) {
  Json::Value result(Json::objectValue);

  const Json::Value &requested =
      params.isObject() ? params["protocolVersion"] : Json::Value::nullSingleton();
  result["protocolVersion"] =
      requested.isString() ? requested.asString() : MCP_PROTOCOL_VERSION;

  result["capabilities"]["tools"] = Json::Value(Json::objectValue);
  result["serverInfo"]["name"] = SERVER_NAME;
  result["serverInfo"]["version"] = VERSION_STRING;
  result["instructions"] = SERVER_INSTRUCTIONS;
  return result;
}

Json::Value Session::tools_list_result() const {
  Json::Value tools(Json::arrayValue);
  for (const auto &tool : dispatcher_.tools()) {
    Json::Value entry(Json::objectValue);
    entry["name"] = tool.name;
    entry["description"] = tool.description;
    entry["inputSchema"] = tool.input_schema;
    tools.append(entry);
  }

  Json::Value result(Json::objectValue);
  result["tools"] = tools;
  return result;
}

} // namespace klip
