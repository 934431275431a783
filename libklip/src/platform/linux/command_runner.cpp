/**
 * @file command_runner.cpp
 * @brief fork/exec with pipes, poll and a kill deadline
 */

#include "command_runner.h"
#include "klip/clipboard.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace klip {
namespace platform {

namespace {

constexpr int POLL_SLICE_MS = 50;

/// Owns a file descriptor
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }

  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

bool make_pipe(Fd &read_end, Fd &write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags >= 0) {
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/// Read everything currently available. Closes @p fd at end of stream.
void drain(Fd &fd, std::string &sink) {
  std::array<char, 4096> buffer;
  while (fd.valid()) {
    ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n > 0) {
      sink.append(buffer.data(), static_cast<size_t>(n));
    } else if (n == 0) {
      fd.reset();
    } else if (errno == EINTR) {
      continue;
    } else {
      // EAGAIN: nothing more for now. Anything else: give up on the stream.
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        fd.reset();
      }
      return;
    }
  }
}

Error spawn_error(const std::string &program, const char *what, int err) {
  return classify_clipboard_failure(
      ClipboardOperation::Open,
      program + ": " + what + ": " + std::strerror(err), err);
}

} // namespace

std::string CommandResult::failure_text(const std::string &program) const {
  std::string text = error_output;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  if (!text.empty()) {
    return text;
  }
  if (term_signal != 0) {
    return program + " killed by signal " + std::to_string(term_signal);
  }
  return program + " exited with status " + std::to_string(exit_code);
}

std::optional<std::string> find_executable(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0) {
      return name;
    }
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    if (end == std::string::npos) {
      end = path.size();
    }

    std::string dir = path.substr(start, end - start);
    if (dir.empty()) {
      dir = ".";
    }

    std::string candidate = dir + "/" + name;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }

    start = end + 1;
  }

  return std::nullopt;
}

Result<CommandResult> run_command(const std::vector<std::string> &argv,
                                  const std::string &input,
                                  std::chrono::milliseconds timeout,
                                  bool capture_output) {
  KLIP_REQUIRE(!argv.empty(), ErrorCode::InvalidArgument, "Empty command");

  // A child that exits before reading its input must not kill us
  static const bool sigpipe_ignored = (::signal(SIGPIPE, SIG_IGN), true);
  KLIP_UNUSED(sigpipe_ignored);

  const std::string &program = argv[0];

  // Built before fork: the child may only make async-signal-safe calls
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  Fd stdin_read, stdin_write;
  Fd stdout_read, stdout_write;
  Fd stderr_read, stderr_write;
  Fd exec_read, exec_write;

  if (!make_pipe(stdin_read, stdin_write) ||
      !make_pipe(stderr_read, stderr_write) ||
      !make_pipe(exec_read, exec_write) ||
      (capture_output && !make_pipe(stdout_read, stdout_write))) {
    return spawn_error(program, "pipe", errno);
  }

  if (!capture_output) {
    stdout_write.reset(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    if (!stdout_write.valid()) {
      return spawn_error(program, "open /dev/null", errno);
    }
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return spawn_error(program, "fork", errno);
  }

  if (pid == 0) {
    // Child
    ::signal(SIGPIPE, SIG_DFL);
    if (::dup2(stdin_read.get(), STDIN_FILENO) < 0 ||
        ::dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(stderr_write.get(), STDERR_FILENO) < 0) {
      int err = errno;
      ssize_t ignored = ::write(exec_write.get(), &err, sizeof(err));
      KLIP_UNUSED(ignored);
      ::_exit(127);
    }
    ::execv(c_argv[0], c_argv.data());
    int err = errno;
    ssize_t ignored = ::write(exec_write.get(), &err, sizeof(err));
    KLIP_UNUSED(ignored);
    ::_exit(127);
  }

  // Parent
  stdin_read.reset();
  stdout_write.reset();
  stderr_write.reset();
  exec_write.reset();

  // Blocks until exec succeeds (CLOEXEC closes the pipe) or reports errno
  int exec_errno = 0;
  ssize_t got;
  do {
    got = ::read(exec_read.get(), &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  exec_read.reset();

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status;
    ::waitpid(pid, &status, 0);
    return spawn_error(program, "exec", exec_errno);
  }

  set_nonblocking(stdin_write.get());
  if (stdout_read.valid()) {
    set_nonblocking(stdout_read.get());
  }
  set_nonblocking(stderr_read.get());

  CommandResult result;
  size_t written = 0;
  if (input.empty()) {
    stdin_write.reset();
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  int status = 0;

  for (;;) {
    pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0 && errno != EINTR) {
      int err = errno;
      ::kill(pid, SIGKILL);
      return spawn_error(program, "waitpid", err);
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      Error err = operation_timeout_error(timeout);
      err.details = program + " killed after deadline";
      return err;
    }

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int wait_ms = static_cast<int>(
        std::min<long long>(remaining.count() + 1, POLL_SLICE_MS));

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    int stdin_slot = -1, stdout_slot = -1, stderr_slot = -1;
    if (stdin_write.valid()) {
      stdin_slot = static_cast<int>(count);
      fds[count++] = {stdin_write.get(), POLLOUT, 0};
    }
    if (stdout_read.valid()) {
      stdout_slot = static_cast<int>(count);
      fds[count++] = {stdout_read.get(), POLLIN, 0};
    }
    if (stderr_read.valid()) {
      stderr_slot = static_cast<int>(count);
      fds[count++] = {stderr_read.get(), POLLIN, 0};
    }

    int ready = ::poll(count > 0 ? fds.data() : nullptr, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      return spawn_error(program, "poll", err);
    }

    if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
      if (fds[stdin_slot].revents & (POLLERR | POLLHUP)) {
        // Child closed its stdin early; whatever it does next decides
        stdin_write.reset();
      } else {
        ssize_t n = ::write(stdin_write.get(), input.data() + written,
                            input.size() - written);
        if (n > 0) {
          written += static_cast<size_t>(n);
          if (written == input.size()) {
            stdin_write.reset();
          }
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
                   errno != EINTR) {
          stdin_write.reset();
        }
      }
    }

    if (stdout_slot >= 0 && fds[stdout_slot].revents != 0) {
      drain(stdout_read, result.output);
    }
    if (stderr_slot >= 0 && fds[stderr_slot].revents != 0) {
      drain(stderr_read, result.error_output);
    }
  }

  // Whatever the child wrote before exiting is already in the pipes
  drain(stdout_read, result.output);
  drain(stderr_read, result.error_output);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }

  if (written < input.size() && result.succeeded()) {
    result.exit_code = 1;
    result.error_output =
        program + " exited before reading all of its input";
  }

  return result;
}

} // namespace platform
} // namespace klip
