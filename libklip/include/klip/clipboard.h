/**
 * @file clipboard.h
 * @brief Exclusive access to the system clipboard
 *
 * The clipboard is a single process-wide resource. klip binds it once at
 * startup (a ClipboardBackend) and hands it to a ClipboardGateway, which
 * is the only object allowed to touch it afterwards:
 * - At most one backend call executes at any instant
 * - Every call is bounded by the operation timeout
 * - Platform failures come back as clipboard error codes only
 *
 * @code
 *   auto backend = open_system_clipboard(config);
 *   if (!backend) {
 *       return backend.error();
 *   }
 *   ClipboardGateway gateway(std::move(backend).value(),
 *                            config.operation_timeout);
 *   gateway.set("Hello, World!");
 * @endcode
 */

#ifndef KLIP_CLIPBOARD_H
#define KLIP_CLIPBOARD_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include <chrono>
#include <memory>
#include <string>

namespace klip {

// ============================================================================
// Clipboard Backend
// ============================================================================

/**
 * @brief Low-level binding to an OS clipboard capability
 *
 * Implementations are not required to be thread-safe; the gateway
 * serializes every call. Errors should use the clipboard codes
 * (ClipboardUnavailable, PermissionDenied, OperationTimeout,
 * NoTextContent, PlatformError); anything else is reported as
 * PlatformError by the gateway.
 *
 * Every call must return within a bounded time. When the gateway gives up
 * on a call, later calls queue behind it on the same worker until it
 * returns; a backend that can block forever wedges the gateway for good.
 * CommandClipboard kills its child at the operation deadline for this
 * reason.
 */
class KLIP_API ClipboardBackend {
public:
  virtual ~ClipboardBackend() = default;

  /// Short backend identifier for logs ("wl-clipboard", "xclip", ...)
  virtual std::string name() const = 0;

  /// Replace the clipboard contents with @p text
  virtual Result<void> set_text(const std::string &text) = 0;

  /// Read the clipboard as UTF-8 text
  virtual Result<std::string> get_text() = 0;
};

// ============================================================================
// Clipboard Gateway
// ============================================================================

/**
 * @brief Sole owner of the clipboard handle
 *
 * Calls run on a dedicated worker thread. The caller waits at most
 * timeout(); when the budget expires the caller gets OperationTimeout
 * and later calls queue behind the abandoned one on the same worker, so
 * two backend calls never overlap.
 *
 * Thread-safe.
 */
class KLIP_API ClipboardGateway {
public:
  ClipboardGateway(std::unique_ptr<ClipboardBackend> handle,
                   std::chrono::milliseconds timeout = DEFAULT_OPERATION_TIMEOUT);
  ~ClipboardGateway();

  // Non-copyable
  ClipboardGateway(const ClipboardGateway &) = delete;
  ClipboardGateway &operator=(const ClipboardGateway &) = delete;

  /**
   * @brief Replace the clipboard contents
   * @param text UTF-8 text, may be empty
   * @return Success or a clipboard error
   */
  Result<void> set(const std::string &text);

  /**
   * @brief Read the clipboard contents
   * @return Text or a clipboard error (NoTextContent for non-text data)
   */
  Result<std::string> get();

  /// Per-operation budget
  std::chrono::milliseconds timeout() const;

  /// Name of the bound backend
  std::string backend_name() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Error Mapping
// ============================================================================

/// Operation a platform failure happened in
enum class ClipboardOperation : uint8_t { Open = 0, Set = 1, Get = 2 };

/**
 * @brief Map a low-level failure onto the clipboard error taxonomy
 * @param op Operation that failed
 * @param details Diagnostic text (tool stderr, strerror output)
 * @param sys_errno errno value if the failure came from a system call
 *
 * NoTextContent is only produced for ClipboardOperation::Get.
 */
KLIP_API Error classify_clipboard_failure(ClipboardOperation op,
                                          const std::string &details,
                                          int sys_errno = 0);

/// Caller-visible error for an expired operation budget
KLIP_API Error operation_timeout_error(std::chrono::milliseconds timeout);

// ============================================================================
// Platform Helpers
// ============================================================================

/**
 * @brief Bind the system clipboard
 * @param config Backend preference and operation timeout
 * @return Backend or ClipboardUnavailable when no display server or
 *         clipboard tool can be found
 */
KLIP_API Result<std::unique_ptr<ClipboardBackend>>
open_system_clipboard(const ServerConfig &config);

/**
 * @brief Check if a system clipboard could be bound right now
 */
KLIP_API bool is_clipboard_available();

} // namespace klip

#endif // KLIP_CLIPBOARD_H
