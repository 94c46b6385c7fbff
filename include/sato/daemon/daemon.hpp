#pragma once

#include "sato/common/result.hpp"
#include "sato/daemon/pid_file.hpp"
#include "sato/daemon/state_writer.hpp"
#include "sato/monitor/monitor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace sato::daemon {

struct DaemonOptions {
  std::filesystem::path pid_file;
  /// Empty disables the status file.
  std::filesystem::path status_file;
  std::chrono::milliseconds drain_timeout{30'000};
  std::chrono::milliseconds timer_poll{100};
  std::chrono::milliseconds status_interval{5'000};
};

/// Drives a Monitor from two threads: a fixed-interval tick driver and a
/// backoff timer worker.
class Daemon {
public:
  Daemon(monitor::Monitor &monitor, DaemonOptions options);
  ~Daemon();

  [[nodiscard]] common::Status start();
  /// Waits for in-flight remediation up to the drain timeout, abandons what
  /// is left, joins the threads and checkpoints.
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t ticks() const { return ticks_; }

private:
  void tick_loop();
  void timer_loop();

  monitor::Monitor &monitor_;
  DaemonOptions options_;
  std::unique_ptr<PidFile> pid_;
  std::unique_ptr<StateWriter> state_writer_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::vector<std::thread> threads_;
};

} // namespace sato::daemon
