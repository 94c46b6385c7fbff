#pragma once

#include "sato/common/result.hpp"

#include <filesystem>
#include <optional>

namespace sato::daemon {

class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] static bool is_process_running(int pid);
  /// Pid recorded at `path` if that process is still alive.
  [[nodiscard]] static std::optional<int> running_pid(const std::filesystem::path &path);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace sato::daemon
