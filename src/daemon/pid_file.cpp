#include "sato/daemon/pid_file.hpp"

#include <fstream>

#include <signal.h>
#include <unistd.h>

namespace sato::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return common::Status::error("failed to create pid directory: " + ec.message());
  }

  if (const auto existing = running_pid(path_); existing.has_value()) {
    return common::Status::error("monitor already running with pid " + std::to_string(*existing));
  }
  std::filesystem::remove(path_, ec);

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to write pid file " + path_.string());
  }
  out << static_cast<int>(getpid()) << "\n";
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0;
}

std::optional<int> PidFile::running_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  int pid = 0;
  in >> pid;
  if (pid > 0 && is_process_running(pid)) {
    return pid;
  }
  return std::nullopt;
}

} // namespace sato::daemon
