#if defined(_WIN32)
#error "shell_posix.cpp should not be compiled on Windows builds"
#else

#include "shell.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace xpm {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr char kShellPath[]{ "/bin/sh" };
constexpr int kPollSliceMs{ 50 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  fd_cleanup &operator=(fd_cleanup &&other) noexcept {
    if (this == &other) { return *this; }
    if (fd_ != -1) { close_with_retry(); }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
  }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct pipe_state {
  fd_cleanup read_fd;
  shell_stream stream;
  std::string pending;
  bool closed;
};

void emit_line(pipe_state const &pipe, std::string_view line, shell_run_cfg const &cfg) {
  if (pipe.stream == shell_stream::std_out) {
    if (cfg.on_stdout_line) { cfg.on_stdout_line(line); }
  } else {
    if (cfg.on_stderr_line) { cfg.on_stderr_line(line); }
  }
  if (cfg.on_output_line) { cfg.on_output_line(line); }
}

bool all_closed(std::array<pipe_state, 2> const &pipes) {
  return pipes[0].closed && pipes[1].closed;
}

void flush_pending(std::array<pipe_state, 2> &pipes, shell_run_cfg const &cfg) {
  for (auto &pipe : pipes) {
    if (pipe.pending.empty()) { continue; }
    emit_line(pipe, pipe.pending, cfg);
    pipe.pending.clear();
  }
}

// One poll round over the open pipes, waiting at most wait_ms. Returns the number of
// pipes that had data or reached EOF.
int pump_pipes(std::array<pipe_state, 2> &pipes, shell_run_cfg const &cfg, int wait_ms) {
  std::array<pollfd, 2> poll_fds{};
  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].closed ? -1 : pipes[i].read_fd.get();
    poll_fds[i].events = pipes[i].closed ? 0 : POLLIN;
  }

  int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), wait_ms) };
  if (poll_result == -1) {
    if (errno == EINTR) { return 0; }
    throw std::system_error(errno, std::generic_category(), "poll failed");
  }
  if (poll_result == 0) { return 0; }

  std::array<char, 4096> chunk{};
  int progressed{ 0 };
  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    if (pipes[i].closed) { continue; }

    short const revents{ poll_fds[i].revents };
    if (revents == 0) { continue; }
    if (revents & (POLLERR | POLLNVAL)) {
      throw std::runtime_error("poll failed on child pipe");
    }

    ssize_t const read_bytes{ ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size()) };
    if (read_bytes == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "read failed");
    }
    ++progressed;

    if (read_bytes == 0) {
      if (!pipes[i].pending.empty()) {
        emit_line(pipes[i], pipes[i].pending, cfg);
        pipes[i].pending.clear();
      }
      pipes[i].closed = true;
      continue;
    }

    pipes[i].pending.append(chunk.data(), static_cast<size_t>(read_bytes));

    size_t newline{ 0 };
    while ((newline = pipes[i].pending.find('\n')) != std::string::npos) {
      std::string line{ pipes[i].pending.substr(0, newline) };
      if (!line.empty() && line.back() == '\r') { line.pop_back(); }
      emit_line(pipes[i], line, cfg);
      pipes[i].pending.erase(0, newline + 1);
    }
  }
  return progressed;
}

shell_result decode_status(int status) {
  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

// Non-blocking reap; nullopt while the child is still running.
std::optional<shell_result> try_reap(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result{ ::waitpid(child, &status, WNOHANG) };
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (result == 0) { return std::nullopt; }
    return decode_status(status);
  }
}

shell_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }
  return decode_status(status);
}

void kill_group(pid_t child) {
  if (::kill(-child, SIGKILL) == -1) { ::kill(child, SIGKILL); }
}

[[noreturn]] void exec_child_process(fd_cleanup &stdout_read,
                                     fd_cleanup &stdout_write,
                                     fd_cleanup &stderr_read,
                                     fd_cleanup &stderr_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::vector<std::string> const &argv_strings,
                                     std::vector<char *> const &envp) {
  ::setpgid(0, 0);  // own group so a timeout can kill grandchildren too

  stdout_read.release();
  stderr_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write.get(), STDOUT_FILENO },
    std::pair{ stderr_write.get(), STDERR_FILENO },
  };

  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  stdout_write.release();
  stderr_write.release();

  if (cwd) {
    if (::chdir(cwd->c_str()) == -1) {
      std::perror("chdir");
      _exit(kChildErrorExit);
    }
  }

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::execve(argv_strings[0].c_str(), argv.data(), const_cast<char **>(envp.data()));
  std::perror("execve");
  _exit(kChildErrorExit);
}

}  // namespace

shell_env_t shell_getenv() {
  shell_env_t env;
  if (!environ) { return env; }

  for (char **entry{ environ }; *entry != nullptr; ++entry) {
    std::string_view kv{ *entry };
    size_t const sep{ kv.find('=') };
    if (sep == std::string_view::npos) { continue; }
    std::string key{ kv.substr(0, sep) };
    std::string value{ kv.substr(sep + 1) };
    env[std::move(key)] = std::move(value);
  }

  return env;
}

shell_result shell_run(std::string_view script, shell_run_cfg const &cfg) {
  std::vector<std::string> const argv_strings{ kShellPath, "-c", std::string{ script } };

  auto const [env_strings, envp]{ [&cfg] {
    std::vector<std::string> strings;
    std::vector<char *> pointers;
    strings.reserve(cfg.env.size());
    pointers.reserve(cfg.env.size() + 1);
    for (auto const &[key, value] : cfg.env) { strings.push_back(key + "=" + value); }
    for (auto &entry : strings) { pointers.push_back(entry.data()); }
    pointers.push_back(nullptr);
    return std::pair{ std::move(strings), std::move(pointers) };
  }() };

  int stdout_pipefd[2];
  if (::pipe(stdout_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe(stderr_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  // Read ends must not leak into concurrently spawned siblings.
  ::fcntl(stdout_read_end.get(), F_SETFD, FD_CLOEXEC);
  ::fcntl(stderr_read_end.get(), F_SETFD, FD_CLOEXEC);
  ::fcntl(stdout_write_end.get(), F_SETFD, FD_CLOEXEC);
  ::fcntl(stderr_write_end.get(), F_SETFD, FD_CLOEXEC);

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (cfg.timeout) { deadline = std::chrono::steady_clock::now() + *cfg.timeout; }

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdout_read_end,
                       stdout_write_end,
                       stderr_read_end,
                       stderr_write_end,
                       cfg.cwd,
                       argv_strings,
                       envp);
  }

  ::setpgid(child, child);     // also set by the child; whichever runs first wins
  stdout_write_end.release();  // Parent: close write ends and stream output
  stderr_write_end.release();

  shell_result result;
  bool reaped{ false };
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), shell_stream::std_out, {}, false },
      pipe_state{ std::move(stderr_read_end), shell_stream::std_err, {}, false },
    };

    // The deadline bounds the shell itself. Pipe EOF only says the output is done:
    // a script may close its streams early, or leave a background job holding them.
    while (true) {
      if (auto const status{ try_reap(child) }) {
        result = *status;
        reaped = true;
        break;
      }

      int wait_ms{ kPollSliceMs };
      if (deadline) {
        auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now()) };
        if (remaining.count() <= 0) {
          kill_group(child);
          result = wait_for_child(child);
          result.timed_out = true;
          reaped = true;
          break;
        }
        if (remaining.count() < wait_ms) { wait_ms = static_cast<int>(remaining.count()); }
      }

      if (all_closed(pipes)) {
        ::poll(nullptr, 0, wait_ms);
      } else {
        pump_pipes(pipes, cfg, wait_ms);
      }
    }

    // Collect what the shell already wrote; stop once the pipes go quiet.
    auto const drain_until{ std::chrono::steady_clock::now() +
                            std::chrono::milliseconds{ kPollSliceMs } };
    while (!all_closed(pipes) && std::chrono::steady_clock::now() < drain_until &&
           pump_pipes(pipes, cfg, 0) > 0) {}
    flush_pending(pipes, cfg);
  } catch (...) {
    if (!reaped) {
      kill_group(child);
      wait_for_child(child);
    }
    throw;
  }

  return result;
}

}  // namespace xpm

#endif  // POSIX implementation
