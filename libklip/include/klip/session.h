/**
 * @file session.h
 * @brief Session loop and its state machine
 *
 * The session reads one frame at a time from the inbound stream, routes
 * it, and writes exactly one response per request (notifications get
 * none). It serves until the inbound stream ends.
 */

#ifndef KLIP_SESSION_H
#define KLIP_SESSION_H

#include "config.h"
#include "dispatcher.h"
#include "error.h"
#include "platform.h"
#include "protocol.h"
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>

#include <json/json.h>

namespace klip {

// ============================================================================
// Session State
// ============================================================================

/**
 * @brief Session loop state
 */
enum class SessionState : uint8_t {
  /// Waiting for the next inbound frame (initial)
  AwaitingMessage = 0,

  /// Routing a decoded message
  Dispatching = 1,

  /// Inbound stream ended (terminal)
  Closed = 2
};

/**
 * @brief Get human-readable name for session state
 */
KLIP_API const char *session_state_name(SessionState state);

// ============================================================================
// Session State Machine
// ============================================================================

/**
 * @brief Enforces valid session state transitions
 *
 * Thread-safe.
 *
 * @code
 *   SessionStateMachine sm;
 *   sm.transition(SessionState::Dispatching);
 *   sm.transition(SessionState::AwaitingMessage);
 *   sm.transition(SessionState::Closed);
 * @endcode
 */
class KLIP_API SessionStateMachine {
public:
  SessionStateMachine();

  SessionState current() const;

  /**
   * @brief Attempt to transition to a new state
   * @return Success or InvalidArgument if the transition is not allowed
   */
  Result<void> transition(SessionState to);

  bool can_transition(SessionState to) const;
  std::set<SessionState> valid_transitions() const;
  bool is_terminal() const;

  using StateChangedCallback =
      std::function<void(SessionState from, SessionState to)>;
  void on_state_changed(StateChangedCallback callback);

private:
  mutable std::mutex mutex_;
  SessionState state_ = SessionState::AwaitingMessage;
  StateChangedCallback state_changed_cb_;

  static const std::map<SessionState, std::set<SessionState>>
      valid_transitions_;
};

// ============================================================================
// Session
// ============================================================================

/**
 * @brief Serves one bidirectional stream until end of input
 *
 * Requests are handled strictly in arrival order; the next frame is not
 * read until the current response has been written.
 */
class KLIP_API Session {
public:
  Session(ToolDispatcher &dispatcher, const ServerConfig &config,
          std::istream &in, std::ostream &out);

  // Non-copyable
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /**
   * @brief Serve until the inbound stream closes
   * @return Success once the inbound stream ends or the outbound stream
   *         can no longer be written (the peer hung up)
   */
  Result<void> run();

  /**
   * @brief Handle one inbound frame
   * @return Encoded response, or nullopt for notifications and blank lines
   *
   * Never fails: malformed input yields a protocol error response.
   */
  std::optional<std::string> handle_frame(const std::string &frame);

  /// Current loop state
  SessionState state() const;

  /// Number of frames answered so far
  uint64_t responses_sent() const { return responses_sent_; }

  /// Whether an initialize request has been answered
  bool initialized() const { return initialized_; }

private:
  void enter(SessionState to);
  std::optional<std::string> handle_request(const RpcRequest &request);
  Json::Value initialize_result(const Json::Value &params);
  Json::Value tools_list_result() const;
  std::optional<std::string> call_tool(const Json::Value &id,
                                       const std::string &name,
                                       const Json::Value &arguments);

  ToolDispatcher &dispatcher_;
  size_t max_message_bytes_;
  std::istream &in_;
  std::ostream &out_;
  SessionStateMachine state_;
  uint64_t responses_sent_ = 0;
  bool initialized_ = false;
};

} // namespace klip

#endif // KLIP_SESSION_H
