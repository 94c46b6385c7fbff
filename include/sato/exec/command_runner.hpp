#pragma once

#include "sato/common/result.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace sato::exec {

struct CommandOptions {
  std::chrono::milliseconds timeout{30'000};
  /// When set and flipped to true, the child is terminated and the result
  /// is marked cancelled.
  const std::atomic<bool> *cancel = nullptr;
};

struct CommandResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool cancelled = false;

  [[nodiscard]] bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /// Fails only when the process could not be started; exit status, timeout
  /// and cancellation are reported in the result.
  [[nodiscard]] virtual common::Result<CommandResult> run(const std::vector<std::string> &argv,
                                                          const CommandOptions &options = {}) = 0;
};

class ProcessRunner final : public CommandRunner {
public:
  [[nodiscard]] common::Result<CommandResult> run(const std::vector<std::string> &argv,
                                                  const CommandOptions &options = {}) override;
};

/// Runs `command` through /bin/sh -c.
[[nodiscard]] std::vector<std::string> shell_argv(const std::string &command);

[[nodiscard]] std::string describe_failure(const CommandResult &result);

} // namespace sato::exec
