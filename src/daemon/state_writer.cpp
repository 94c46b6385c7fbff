#include "sato/daemon/state_writer.hpp"

#include "sato/common/time.hpp"
#include "sato/health/health.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace sato::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, StatusFn status,
                         const std::chrono::milliseconds interval)
    : state_file_(std::move(state_file)), status_(std::move(status)), interval_(interval) {}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateWriter::is_running() const { return running_; }

void StateWriter::write_loop() {
  while (running_) {
    (void)write_state();
    const auto steps = std::max<std::int64_t>(1, interval_.count() / 100);
    for (std::int64_t i = 0; i < steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  (void)write_state();
}

bool StateWriter::write_state() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":\"" << common::now_rfc3339() << "\",";
  json << "\"uptime_seconds\":" << (running_ ? uptime : 0) << ",";
  json << "\"health\":" << health::snapshot_json() << ",";
  json << "\"monitor\":" << (status_ ? status_() : std::string("{}"));
  json << "}";

  std::error_code ec;
  std::filesystem::create_directories(state_file_.parent_path(), ec);
  const auto temp_path = state_file_.string() + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out) {
      return false;
    }
    out << json.str();
  }
  std::filesystem::rename(temp_path, state_file_, ec);
  return !ec;
}

} // namespace sato::daemon
