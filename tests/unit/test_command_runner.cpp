/**
 * @file test_command_runner.cpp
 * @brief Unit tests for the Linux subprocess clipboard backend
 */

#include "platform/linux/clipboard_linux.h"
#include "platform/linux/command_runner.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unistd.h>

using namespace klip;
using namespace klip::platform;

namespace {

std::string shell() {
  auto sh = find_executable("sh");
  return sh ? *sh : std::string("/bin/sh");
}

constexpr std::chrono::milliseconds kTimeout{5000};

} // namespace

// ============================================================================
// find_executable
// ============================================================================

TEST(CommandRunnerTest, FindsExecutableOnPath) {
  auto sh = find_executable("sh");
  ASSERT_TRUE(sh.has_value());
  EXPECT_EQ(access(sh->c_str(), X_OK), 0);
}

TEST(CommandRunnerTest, MissingExecutable) {
  EXPECT_FALSE(find_executable("klip-no-such-tool-xyz").has_value());
  EXPECT_FALSE(find_executable("").has_value());
}

// ============================================================================
// run_command
// ============================================================================

TEST(CommandRunnerTest, PipesInputToOutput) {
  auto cat = find_executable("cat");
  ASSERT_TRUE(cat.has_value());

  std::string input = "Hello 世界 🌍\n";
  auto result = run_command({*cat}, input, kTimeout);
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();
  EXPECT_TRUE(result.value().succeeded());
  EXPECT_EQ(result.value().output, input);
}

TEST(CommandRunnerTest, LargeInputDoesNotDeadlock) {
  auto cat = find_executable("cat");
  ASSERT_TRUE(cat.has_value());

  std::string input(1024 * 1024, 'z');
  auto result = run_command({*cat}, input, kTimeout);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().output.size(), input.size());
}

TEST(CommandRunnerTest, CapturesExitStatusAndStderr) {
  auto result =
      run_command({shell(), "-c", "echo oops >&2; exit 4"}, "", kTimeout);
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().succeeded());
  EXPECT_EQ(result.value().exit_code, 4);
  EXPECT_EQ(result.value().failure_text("sh"), "oops");
}

TEST(CommandRunnerTest, FailureTextWithoutStderr) {
  auto result = run_command({shell(), "-c", "exit 3"}, "", kTimeout);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().failure_text("sh"), "sh exited with status 3");
}

TEST(CommandRunnerTest, ReportsTerminatingSignal) {
  auto result = run_command({shell(), "-c", "kill -9 $$"}, "", kTimeout);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().term_signal, 9);
  EXPECT_EQ(result.value().failure_text("sh"), "sh killed by signal 9");
}

TEST(CommandRunnerTest, DiscardsOutputWhenNotCaptured) {
  auto result =
      run_command({shell(), "-c", "echo hidden"}, "", kTimeout, false);
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().succeeded());
  EXPECT_TRUE(result.value().output.empty());
}

TEST(CommandRunnerTest, KillsChildAtDeadline) {
  auto start = std::chrono::steady_clock::now();
  auto result = run_command({shell(), "-c", "sleep 5"}, "",
                            std::chrono::milliseconds(200));
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::OperationTimeout);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(CommandRunnerTest, ExecFailureIsUnavailable) {
  auto result = run_command({"/nonexistent/klip-tool"}, "", kTimeout);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardUnavailable);
}

TEST(CommandRunnerTest, EmptyArgvRejected) {
  auto result = run_command({}, "", kTimeout);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

// ============================================================================
// Display Detection
// ============================================================================

class DisplayServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    save("WAYLAND_DISPLAY", wayland_);
    save("DISPLAY", display_);
    save("PATH", path_);
  }

  void TearDown() override {
    restore("WAYLAND_DISPLAY", wayland_);
    restore("DISPLAY", display_);
    restore("PATH", path_);
  }

private:
  static void save(const char *name, std::optional<std::string> &slot) {
    const char *value = std::getenv(name);
    if (value != nullptr) {
      slot = value;
    }
  }

  static void restore(const char *name, const std::optional<std::string> &slot) {
    if (slot) {
      setenv(name, slot->c_str(), 1);
    } else {
      unsetenv(name);
    }
  }

  std::optional<std::string> wayland_;
  std::optional<std::string> display_;
  std::optional<std::string> path_;
};

TEST_F(DisplayServerTest, WaylandWins) {
  setenv("WAYLAND_DISPLAY", "wayland-0", 1);
  setenv("DISPLAY", ":0", 1);
  EXPECT_EQ(detect_display_server(), DisplayServer::Wayland);
}

TEST_F(DisplayServerTest, X11Only) {
  unsetenv("WAYLAND_DISPLAY");
  setenv("DISPLAY", ":0", 1);
  EXPECT_EQ(detect_display_server(), DisplayServer::X11);
}

TEST_F(DisplayServerTest, NoDisplay) {
  unsetenv("WAYLAND_DISPLAY");
  unsetenv("DISPLAY");
  EXPECT_EQ(detect_display_server(), DisplayServer::None);

  auto commands = resolve_clipboard_commands(DisplayServer::None);
  ASSERT_TRUE(commands.is_error());
  EXPECT_EQ(commands.error().code, ErrorCode::ClipboardUnavailable);

  EXPECT_FALSE(is_clipboard_available());
  auto opened = open_system_clipboard(ServerConfig{});
  ASSERT_TRUE(opened.is_error());
  EXPECT_EQ(opened.error().code, ErrorCode::ClipboardUnavailable);
}

TEST_F(DisplayServerTest, OpensWaylandToolsFromPath) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() /
                 ("klip_test_tools_" + std::to_string(getpid()));
  fs::create_directories(dir);
  fs::path store = dir / "store";

  auto write_tool = [&](const char *name, const std::string &body) {
    fs::path tool = dir / name;
    std::ofstream(tool) << "#!/bin/sh\n" << body << "\n";
    fs::permissions(tool, fs::perms::owner_all);
  };
  write_tool("wl-copy", "cat > '" + store.string() + "'");
  write_tool("wl-paste", "cat '" + store.string() + "'");

  const char *old_path = std::getenv("PATH");
  std::string path = dir.string() + ":" + (old_path ? old_path : "/usr/bin:/bin");
  setenv("PATH", path.c_str(), 1);
  setenv("WAYLAND_DISPLAY", "wayland-test", 1);

  EXPECT_TRUE(is_clipboard_available());

  ServerConfig config;
  auto opened = open_system_clipboard(config);
  ASSERT_TRUE(opened.is_ok()) << opened.error().to_string();
  EXPECT_EQ(opened.value()->name(), "wl-clipboard");

  ClipboardGateway gateway(std::move(opened).value(), config.operation_timeout);
  ASSERT_TRUE(gateway.set("through the shims").is_ok());
  auto got = gateway.get();
  ASSERT_TRUE(got.is_ok()) << got.error().to_string();
  EXPECT_EQ(got.value(), "through the shims");

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(DisplayServerNameTest, Names) {
  EXPECT_STREQ(display_server_name(DisplayServer::None), "none");
  EXPECT_STREQ(display_server_name(DisplayServer::X11), "x11");
  EXPECT_STREQ(display_server_name(DisplayServer::Wayland), "wayland");
}

// ============================================================================
// CommandClipboard
// ============================================================================

class CommandClipboardTest : public ::testing::Test {
protected:
  std::filesystem::path store;

  void SetUp() override {
    store = std::filesystem::temp_directory_path() /
            ("klip_test_clipboard_" + std::to_string(getpid()));
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(store, ec);
  }

  /// Copy writes stdin to a file, paste prints it back
  ClipboardCommands file_commands() const {
    ClipboardCommands commands;
    commands.tool = "file";
    commands.copy_argv = {shell(), "-c", "cat > \"$0\"", store.string()};
    commands.paste_argv = {shell(), "-c", "cat \"$0\"", store.string()};
    return commands;
  }

  static ClipboardCommands failing_commands(const std::string &script) {
    ClipboardCommands commands;
    commands.tool = "broken";
    commands.copy_argv = {shell(), "-c", "cat >/dev/null; " + script};
    commands.paste_argv = {shell(), "-c", script};
    return commands;
  }
};

TEST_F(CommandClipboardTest, RoundTrip) {
  CommandClipboard clipboard(file_commands(), kTimeout);
  EXPECT_EQ(clipboard.name(), "file");

  const std::string text = "Hello 世界 🌍\nwith newline";
  ASSERT_TRUE(clipboard.set_text(text).is_ok());

  auto got = clipboard.get_text();
  ASSERT_TRUE(got.is_ok()) << got.error().to_string();
  EXPECT_EQ(got.value(), text);
}

TEST_F(CommandClipboardTest, ThroughGateway) {
  ClipboardGateway gateway(
      std::make_unique<CommandClipboard>(file_commands(), kTimeout));

  ASSERT_TRUE(gateway.set("via gateway").is_ok());
  auto got = gateway.get();
  ASSERT_TRUE(got.is_ok());
  EXPECT_EQ(got.value(), "via gateway");
}

TEST_F(CommandClipboardTest, PermissionFailure) {
  CommandClipboard clipboard(
      failing_commands("echo 'Permission denied' >&2; exit 1"), kTimeout);

  auto result = clipboard.set_text("text");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PermissionDenied);
}

TEST_F(CommandClipboardTest, MissingDisplay) {
  CommandClipboard clipboard(
      failing_commands("echo \"Error: Can't open display: :99\" >&2; exit 1"),
      kTimeout);

  auto result = clipboard.set_text("text");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardUnavailable);
}

TEST_F(CommandClipboardTest, EmptySelectionIsNoText) {
  CommandClipboard clipboard(
      failing_commands("echo 'No selection' >&2; exit 1"), kTimeout);

  auto result = clipboard.get_text();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoTextContent);
}

TEST_F(CommandClipboardTest, BinaryContentIsNoText) {
  CommandClipboard clipboard(failing_commands("printf '\\377\\376'"),
                             kTimeout);

  auto result = clipboard.get_text();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NoTextContent);
}

TEST_F(CommandClipboardTest, UnclassifiedFailure) {
  CommandClipboard clipboard(failing_commands("exit 7"), kTimeout);

  auto result = clipboard.set_text("text");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PlatformError);
  EXPECT_EQ(result.error().details, "broken exited with status 7");
}
