#include "sato/exec/command_runner.hpp"

#include "sato/common/fs.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sato::exec {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void drain(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

// The child leads its own process group so shell pipelines die together.
void terminate_group(const pid_t pid, int &status) {
  if (kill(-pid, SIGTERM) != 0) {
    (void)kill(pid, SIGTERM);
  }
  for (int i = 0; i < 20; ++i) {
    if (waitpid(pid, &status, WNOHANG) == pid) {
      return;
    }
    usleep(50 * 1000);
  }
  if (kill(-pid, SIGKILL) != 0) {
    (void)kill(pid, SIGKILL);
  }
  (void)waitpid(pid, &status, 0);
}

} // namespace

common::Result<CommandResult> ProcessRunner::run(const std::vector<std::string> &argv,
                                                 const CommandOptions &options) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<CommandResult>::failure("command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return common::Result<CommandResult>::failure("failed to create pipes for " + argv.front());
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_pair(stdout_pipe);
    close_pair(stderr_pipe);
    return common::Result<CommandResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    std::vector<char *> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      child_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    execvp(child_argv[0], child_argv.data());
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  CommandResult result;
  int status = 0;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    drain(stdout_pipe[0], result.stdout_text);
    drain(stderr_pipe[0], result.stderr_text);

    if (waitpid(pid, &status, WNOHANG) == pid) {
      break;
    }

    if (options.cancel != nullptr && options.cancel->load()) {
      result.cancelled = true;
      terminate_group(pid, status);
      break;
    }
    if (std::chrono::steady_clock::now() - started > options.timeout) {
      result.timed_out = true;
      terminate_group(pid, status);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  drain(stdout_pipe[0], result.stdout_text);
  drain(stderr_pipe[0], result.stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out || result.cancelled) {
    result.exit_code = -1;
  }
  return common::Result<CommandResult>::success(std::move(result));
}

std::vector<std::string> shell_argv(const std::string &command) {
  return {"/bin/sh", "-c", command};
}

std::string describe_failure(const CommandResult &result) {
  if (result.cancelled) {
    return "cancelled";
  }
  if (result.timed_out) {
    return "timed out";
  }
  std::string detail = common::trim(result.stderr_text);
  if (detail.size() > 200) {
    detail.resize(200);
  }
  if (detail.empty()) {
    return "exit code " + std::to_string(result.exit_code);
  }
  return "exit code " + std::to_string(result.exit_code) + ": " + detail;
}

} // namespace sato::exec
