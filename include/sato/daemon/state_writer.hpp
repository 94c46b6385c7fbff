#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace sato::daemon {

/// Periodically publishes the monitor's status document plus component
/// health to a JSON file for status bars and dashboards.
class StateWriter {
public:
  using StatusFn = std::function<std::string()>;

  StateWriter(std::filesystem::path state_file, StatusFn status,
              std::chrono::milliseconds interval = std::chrono::seconds(5));
  ~StateWriter();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Writes once through a temp file and rename.
  bool write_state() const;

private:
  void write_loop();

  std::filesystem::path state_file_;
  StatusFn status_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace sato::daemon
