#include "sato/maintenance/window_manager.hpp"

#include "sato/common/fs.hpp"

#include <algorithm>

namespace sato::maintenance {

MaintenanceScope MaintenanceScope::of(std::set<std::string> ids) {
  if (ids.empty()) {
    return everything();
  }
  return MaintenanceScope{.all = false, .services = std::move(ids)};
}

bool MaintenanceScope::covers(const std::string &service_id) const {
  return all || services.contains(service_id);
}

std::string MaintenanceScope::to_string() const {
  if (all) {
    return "*";
  }
  return common::join(std::vector<std::string>(services.begin(), services.end()), ",");
}

common::Result<MaintenanceScope> MaintenanceScope::parse(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty() || trimmed == "*" || trimmed == "all") {
    return common::Result<MaintenanceScope>::success(everything());
  }
  std::set<std::string> ids;
  for (const auto &part : common::split(trimmed, ',')) {
    const std::string id = common::trim(part);
    if (id.empty()) {
      return common::Result<MaintenanceScope>::failure("empty service id in scope: " + text);
    }
    ids.insert(id);
  }
  return common::Result<MaintenanceScope>::success(of(std::move(ids)));
}

WindowManager::WindowManager(const std::chrono::seconds manual_duration)
    : manual_duration_(manual_duration) {}

bool WindowManager::toggle_now(const MaintenanceScope &scope, const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool ended = false;
  for (auto &window : windows_) {
    if (window.manual && window.scope == scope && window.active_at(now)) {
      window.duration = std::chrono::duration_cast<std::chrono::seconds>(now - window.start);
      ended = true;
    }
  }
  if (ended) {
    return false;
  }
  windows_.push_back(MaintenanceWindow{
      .id = next_id_++, .scope = scope, .start = now, .duration = manual_duration_, .manual = true});
  return true;
}

void WindowManager::set_manual(const MaintenanceScope &scope, const bool on,
                               const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool running = false;
  for (auto &window : windows_) {
    if (!window.manual || !window.active_at(now)) {
      continue;
    }
    if (on) {
      running = running || window.scope == scope;
    } else if (scope.all || window.scope == scope) {
      // Turning "all" off ends every manual window.
      window.duration = std::chrono::duration_cast<std::chrono::seconds>(now - window.start);
    }
  }
  if (on && !running) {
    windows_.push_back(MaintenanceWindow{.id = next_id_++,
                                         .scope = scope,
                                         .start = now,
                                         .duration = manual_duration_,
                                         .manual = true});
  }
}

common::Result<std::uint64_t> WindowManager::schedule(const common::TimePoint start,
                                                      const std::chrono::seconds duration,
                                                      const MaintenanceScope &scope) {
  if (duration <= std::chrono::seconds::zero()) {
    return common::Result<std::uint64_t>::failure("maintenance duration must be positive");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t id = next_id_++;
  windows_.push_back(MaintenanceWindow{
      .id = id, .scope = scope, .start = start, .duration = duration, .manual = false});
  return common::Result<std::uint64_t>::success(id);
}

bool WindowManager::active(const std::string &service_id, const common::TimePoint now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(windows_.begin(), windows_.end(), [&](const MaintenanceWindow &window) {
    return window.active_at(now) && window.scope.covers(service_id);
  });
}

bool WindowManager::any_active(const common::TimePoint now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(windows_.begin(), windows_.end(),
                     [now](const MaintenanceWindow &window) { return window.active_at(now); });
}

std::vector<MaintenanceWindow> WindowManager::windows() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_;
}

std::size_t WindowManager::prune(const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = windows_.size();
  windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                [now](const MaintenanceWindow &window) {
                                  return window.end() <= now;
                                }),
                 windows_.end());
  return before - windows_.size();
}

void WindowManager::restore(std::vector<MaintenanceWindow> windows) {
  std::lock_guard<std::mutex> lock(mutex_);
  windows_ = std::move(windows);
  for (const auto &window : windows_) {
    next_id_ = std::max(next_id_, window.id + 1);
  }
}

} // namespace sato::maintenance
