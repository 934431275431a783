/**
 * @file fake_clipboard.h
 * @brief In-memory clipboard backend for tests
 */

#ifndef KLIP_TESTS_FAKE_CLIPBOARD_H
#define KLIP_TESTS_FAKE_CLIPBOARD_H

#include <klip/clipboard.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace klip {
namespace test {

/**
 * State shared between a test and the FakeClipboard it handed to a gateway.
 * The gateway owns the backend, the test keeps this to observe it.
 */
struct FakeClipboardState {
  std::mutex mutex;
  std::string content;
  std::optional<Error> failure;
  bool has_text = true;

  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  std::atomic<int> set_calls{0};
  std::atomic<int> get_calls{0};
  std::atomic<int> delay_ms{0};

  /// Fail every call with @p error until clear_failure()
  void fail_with(Error error) {
    std::lock_guard<std::mutex> lock(mutex);
    failure = std::move(error);
  }

  void clear_failure() {
    std::lock_guard<std::mutex> lock(mutex);
    failure.reset();
  }

  std::string snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return content;
  }
};

class FakeClipboard : public ClipboardBackend {
public:
  explicit FakeClipboard(std::shared_ptr<FakeClipboardState> state)
      : state_(std::move(state)) {}

  std::string name() const override { return "fake"; }

  Result<void> set_text(const std::string &text) override {
    Scope scope(*state_);
    ++state_->set_calls;

    if (auto failure = current_failure()) {
      return *failure;
    }

    // Written piecewise so overlapping writers would interleave
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->content.clear();
    }
    for (char c : text) {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->content.push_back(c);
    }
    return Result<void>::ok();
  }

  Result<std::string> get_text() override {
    Scope scope(*state_);
    ++state_->get_calls;

    if (auto failure = current_failure()) {
      return *failure;
    }

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->has_text) {
      return Error(ErrorCode::NoTextContent, "Clipboard contains non-text data");
    }
    return state_->content;
  }

private:
  /// Tracks overlap and applies the configured delay
  class Scope {
  public:
    explicit Scope(FakeClipboardState &state) : state_(state) {
      int now = ++state_.active;
      int seen = state_.max_active.load();
      while (now > seen && !state_.max_active.compare_exchange_weak(seen, now)) {
      }
      int delay = state_.delay_ms.load();
      if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
      }
    }
    ~Scope() { --state_.active; }

  private:
    FakeClipboardState &state_;
  };

  std::optional<Error> current_failure() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->failure;
  }

  std::shared_ptr<FakeClipboardState> state_;
};

/// Build a fake backend and keep a handle to its state
inline std::unique_ptr<ClipboardBackend>
make_fake_clipboard(std::shared_ptr<FakeClipboardState> &state) {
  state = std::make_shared<FakeClipboardState>();
  return std::make_unique<FakeClipboard>(state);
}

} // namespace test
} // namespace klip

#endif // KLIP_TESTS_FAKE_CLIPBOARD_H
