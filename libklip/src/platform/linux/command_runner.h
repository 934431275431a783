/**
 * @file command_runner.h
 * @brief Deadline-bounded child process execution
 *
 * Used by the Linux clipboard backend to drive wl-clipboard, xclip and
 * xsel. Internal header.
 */

#ifndef KLIP_PLATFORM_LINUX_COMMAND_RUNNER_H
#define KLIP_PLATFORM_LINUX_COMMAND_RUNNER_H

#include "klip/error.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace klip {
namespace platform {

/**
 * @brief Outcome of a command that ran to completion
 */
struct CommandResult {
  /// Exit status, or -1 if the child was killed by a signal
  int exit_code = -1;

  /// Terminating signal (0 if the child exited normally)
  int term_signal = 0;

  /// Captured standard output
  std::string output;

  /// Captured standard error
  std::string error_output;

  bool succeeded() const { return exit_code == 0 && term_signal == 0; }

  /// stderr if non-empty, else a status line such as "exited with status 1"
  std::string failure_text(const std::string &program) const;
};

/**
 * @brief Resolve an executable name against PATH
 * @return Absolute path, or nullopt if no executable match exists
 */
std::optional<std::string> find_executable(const std::string &name);

/**
 * @brief Run a command, feeding @p input to its standard input
 * @param argv argv[0] is an executable path
 * @param input Bytes written to stdin, which is then closed
 * @param timeout Wall-clock budget for the whole run
 * @param capture_output Capture stdout; when false stdout is /dev/null
 * @return Result once the child exits, OperationTimeout if the budget
 *         expires (the child is killed), or a spawn failure
 *
 * The command is considered finished when the direct child exits, even if
 * it left a daemon behind holding the selection (xclip, wl-copy).
 */
Result<CommandResult> run_command(const std::vector<std::string> &argv,
                                  const std::string &input,
                                  std::chrono::milliseconds timeout,
                                  bool capture_output = true);

} // namespace platform
} // namespace klip

#endif // KLIP_PLATFORM_LINUX_COMMAND_RUNNER_H
