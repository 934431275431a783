/**
 * @file clipboard.cpp
 * @brief Clipboard gateway implementation
 */

#include "clipboard_pimpl.h"
#include "klip/log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

namespace klip {

// ============================================================================
// Worker State
// ============================================================================

namespace {

/**
 * Shared between the gateway and its worker thread. The worker keeps its
 * own reference so an abandoned call can finish after the gateway is gone.
 */
struct WorkerState {
  std::unique_ptr<ClipboardBackend> handle;

  // Held for the duration of every backend call
  std::mutex handle_mutex;

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::deque<std::function<void()>> jobs;
  bool stopping = false;
  bool busy = false;
};

void worker_loop(std::shared_ptr<WorkerState> state) {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(state->queue_mutex);
      state->queue_cv.wait(
          lock, [&] { return state->stopping || !state->jobs.empty(); });
      if (state->stopping) {
        return;
      }
      job = std::move(state->jobs.front());
      state->jobs.pop_front();
      state->busy = true;
    }

    job();

    std::lock_guard<std::mutex> lock(state->queue_mutex);
    state->busy = false;
  }
}

std::string with_details(const std::string &base, const std::string &details) {
  if (details.empty()) {
    return base;
  }
  return base + ": " + details;
}

std::string trim(const std::string &text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
               return std::isspace(c) != 0;
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

// ============================================================================
// Error Mapping
// ============================================================================

Error operation_timeout_error(std::chrono::milliseconds timeout) {
  std::string budget;
  if (timeout.count() % 1000 == 0) {
    auto seconds = timeout.count() / 1000;
    budget = std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
  } else {
    budget = std::to_string(timeout.count()) + " ms";
  }
  return Error(ErrorCode::OperationTimeout,
               "Clipboard operation timed out after " + budget);
}

Error classify_clipboard_failure(ClipboardOperation op,
                                 const std::string &details, int sys_errno) {
  std::string detail = trim(details);
  std::string lower = detail;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto contains = [&lower](const char *needle) {
    return lower.find(needle) != std::string::npos;
  };

  if (sys_errno == EACCES || sys_errno == EPERM ||
      contains("permission denied") || contains("not authorized") ||
      contains("access denied") || contains("not permitted")) {
    return Error(ErrorCode::PermissionDenied,
                 with_details("Permission denied accessing the clipboard",
                              detail),
                 detail);
  }

  if (sys_errno == ETIMEDOUT || contains("timed out")) {
    return Error(ErrorCode::OperationTimeout,
                 with_details("Clipboard operation timed out", detail), detail);
  }

  if (op == ClipboardOperation::Get &&
      (contains("not available") || contains("no suitable type") ||
       contains("nothing is copied") || contains("no selection") ||
       contains("non-text"))) {
    return Error(ErrorCode::NoTextContent, "Clipboard contains non-text data",
                 detail);
  }

  if (sys_errno == ENOENT || contains("can't open display") ||
      contains("cannot open display") || contains("failed to connect") ||
      contains("no display") || contains("not found")) {
    return Error(ErrorCode::ClipboardUnavailable,
                 with_details("Clipboard unavailable", detail), detail);
  }

  return Error(ErrorCode::PlatformError,
               with_details("Clipboard platform error", detail), detail);
}

// ============================================================================
// ClipboardGateway Implementation
// ============================================================================

class ClipboardGateway::Impl {
public:
  std::shared_ptr<WorkerState> state;
  std::chrono::milliseconds timeout;
  std::string backend_name;
  std::thread worker;

  template <typename T>
  Result<T> run(const char *op_name,
                std::function<Result<T>(ClipboardBackend &)> op) {
    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();

    {
      std::lock_guard<std::mutex> lock(state->queue_mutex);
      if (state->stopping) {
        return Error(ErrorCode::ClipboardUnavailable,
                     "Clipboard unavailable: gateway is shutting down");
      }

      WorkerState *st = state.get();
      state->jobs.push_back([st, op = std::move(op), promise]() {
        std::lock_guard<std::mutex> handle_lock(st->handle_mutex);
        try {
          promise->set_value(op(*st->handle));
        } catch (const std::exception &e) {
          promise->set_value(Result<T>(Error(
              ErrorCode::PlatformError,
              with_details("Clipboard platform error", e.what()), e.what())));
        }
      });
    }
    state->queue_cv.notify_one();

    if (future.wait_for(timeout) != std::future_status::ready) {
      log_warn("clipboard {} did not finish within {} ms, abandoning it",
               op_name, timeout.count());
      return operation_timeout_error(timeout);
    }

    Result<T> result = future.get();
    if (result.is_error() && !is_clipboard_error(result.error().code)) {
      const Error &raw = result.error();
      std::string detail = raw.message.empty() ? raw.details : raw.message;
      return Error(ErrorCode::PlatformError,
                   with_details("Clipboard platform error", detail), detail);
    }
    return result;
  }
};

ClipboardGateway::ClipboardGateway(std::unique_ptr<ClipboardBackend> handle,
                                   std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>()) {
  impl_->state = std::make_shared<WorkerState>();
  impl_->backend_name = handle ? handle->name() : std::string("none");
  impl_->state->handle = std::move(handle);
  impl_->timeout = timeout;
  impl_->worker = std::thread(worker_loop, impl_->state);
}

ClipboardGateway::~ClipboardGateway() {
  bool abandoned;
  {
    std::lock_guard<std::mutex> lock(impl_->state->queue_mutex);
    impl_->state->stopping = true;
    abandoned = impl_->state->busy;
  }
  impl_->state->queue_cv.notify_all();

  if (impl_->worker.joinable()) {
    if (abandoned) {
      // A timed-out call is still inside the backend; it owns a reference
      // to the worker state and finishes on its own.
      impl_->worker.detach();
    } else {
      impl_->worker.join();
    }
  }
}

Result<void> ClipboardGateway::set(const std::string &text) {
  if (!impl_->state->handle) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Clipboard unavailable: no clipboard bound");
  }

  // Copied: the job may outlive this call if it times out
  return impl_->run<void>("set", [text](ClipboardBackend &backend) {
    return backend.set_text(text);
  });
}

Result<std::string> ClipboardGateway::get() {
  if (!impl_->state->handle) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "Clipboard unavailable: no clipboard bound");
  }

  return impl_->run<std::string>(
      "get", [](ClipboardBackend &backend) { return backend.get_text(); });
}

std::chrono::milliseconds ClipboardGateway::timeout() const {
  return impl_->timeout;
}

std::string ClipboardGateway::backend_name() const {
  return impl_->backend_name;
}

// ============================================================================
// Platform Helpers
// ============================================================================

Result<std::unique_ptr<ClipboardBackend>>
open_system_clipboard(const ServerConfig &config) {
  return platform_open_clipboard(config);
}

bool is_clipboard_available() { return platform_clipboard_available(); }

} // namespace klip
