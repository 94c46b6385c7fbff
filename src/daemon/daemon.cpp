#include "sato/daemon/daemon.hpp"

#include "sato/health/health.hpp"
#include "sato/observability/global.hpp"

#include <iostream>
#include <system_error>

namespace sato::daemon {

Daemon::Daemon(monitor::Monitor &monitor, DaemonOptions options)
    : monitor_(monitor), options_(std::move(options)) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start() {
  if (running_) {
    return common::Status::error("daemon already running");
  }

  if (!options_.pid_file.empty()) {
    auto pid = std::make_unique<PidFile>(options_.pid_file);
    if (auto status = pid->acquire(); !status.ok()) {
      return status;
    }
    pid_ = std::move(pid);
  }

  if (!options_.status_file.empty()) {
    state_writer_ = std::make_unique<StateWriter>(
        options_.status_file, [this]() { return monitor_.status_json(); },
        options_.status_interval);
    state_writer_->start();
  }

  monitor_.set_stopping(false);
  running_ = true;
  threads_.clear();
  threads_.emplace_back([this]() { tick_loop(); });
  threads_.emplace_back([this]() { timer_loop(); });
  std::cerr << "[daemon] started services=" << monitor_.services().size()
            << " interval_ms=" << monitor_.driver_interval().count() << "\n";
  return common::Status::success();
}

void Daemon::tick_loop() {
  health::mark_component_starting("tick");
  const auto interval = monitor_.driver_interval();
  while (running_) {
    const auto started = std::chrono::steady_clock::now();
    try {
      const auto report = monitor_.tick();
      ++ticks_;
      health::mark_component_ok("tick");
      for (const auto &transition : report.transitions) {
        std::cerr << "[daemon][tick] service=" << transition.service_id
                  << " from=" << status::state_to_string(transition.from)
                  << " to=" << status::state_to_string(transition.to);
        if (transition.caused_by.has_value()) {
          std::cerr << " caused_by=" << *transition.caused_by;
        }
        std::cerr << "\n";
      }
    } catch (const std::exception &ex) {
      health::mark_component_error("tick", ex.what());
      observability::record_error("tick", ex.what());
      std::cerr << "[daemon][tick] tick_exception " << ex.what() << "\n";
    }

    while (running_ && std::chrono::steady_clock::now() - started < interval) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  health::mark_component_stopped("tick");
}

void Daemon::timer_loop() {
  health::mark_component_starting("timers");
  health::mark_component_ok("timers");
  while (running_) {
    try {
      const auto issued = monitor_.fire_due_timers();
      if (issued > 0) {
        std::cerr << "[daemon][timers] remediation_issued count=" << issued << "\n";
      }
    } catch (const std::exception &ex) {
      health::mark_component_error("timers", ex.what());
      observability::record_error("timers", ex.what());
      std::cerr << "[daemon][timers] timer_exception " << ex.what() << "\n";
    }
    std::this_thread::sleep_for(options_.timer_poll);
  }
  health::mark_component_stopped("timers");
}

void Daemon::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  monitor_.set_stopping(true);

  const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
  while (monitor_.in_flight() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (monitor_.in_flight() > 0) {
    std::cerr << "[daemon] drain timeout reached; abandoning in-flight remediation\n";
    monitor_.abandon_in_flight();
  }

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      try {
        thread.join();
      } catch (const std::system_error &err) {
        std::cerr << "[daemon] thread join failed: " << err.what() << "\n";
      }
    }
  }
  threads_.clear();

  if (auto status = monitor_.checkpoint(); !status.ok()) {
    health::mark_component_error("store", status.error());
    std::cerr << "[daemon] final checkpoint failed: " << status.error() << "\n";
  }
  if (state_writer_ != nullptr) {
    state_writer_->stop();
    state_writer_.reset();
  }
  if (pid_ != nullptr) {
    pid_->release();
    pid_.reset();
  }
  std::cerr << "[daemon] stopped ticks=" << ticks_.load() << "\n";
}

bool Daemon::is_running() const { return running_; }

} // namespace sato::daemon
