#pragma once

#include "sato/common/result.hpp"
#include "sato/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sato::maintenance {

struct MaintenanceScope {
  bool all = true;
  std::set<std::string> services;

  [[nodiscard]] static MaintenanceScope everything() { return MaintenanceScope{}; }
  [[nodiscard]] static MaintenanceScope of(std::set<std::string> ids);

  [[nodiscard]] bool covers(const std::string &service_id) const;
  /// "*" for all services, otherwise a comma-separated id list.
  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] static common::Result<MaintenanceScope> parse(const std::string &text);

  bool operator==(const MaintenanceScope &other) const = default;
};

struct MaintenanceWindow {
  std::uint64_t id = 0;
  MaintenanceScope scope;
  common::TimePoint start{};
  std::chrono::seconds duration{0};
  /// Created by an operator toggle rather than a schedule.
  bool manual = false;

  [[nodiscard]] common::TimePoint end() const { return start + duration; }
  [[nodiscard]] bool active_at(common::TimePoint now) const {
    return now >= start && now < end();
  }
};

/// Activity is always derived from the clock; nothing stores an "active" bit.
class WindowManager {
public:
  explicit WindowManager(std::chrono::seconds manual_duration = std::chrono::minutes(60));

  /// Ends a running manual window with the same scope, otherwise opens one.
  /// Returns whether maintenance is now on for that scope.
  bool toggle_now(const MaintenanceScope &scope, common::TimePoint now);
  void set_manual(const MaintenanceScope &scope, bool on, common::TimePoint now);

  [[nodiscard]] common::Result<std::uint64_t> schedule(common::TimePoint start,
                                                       std::chrono::seconds duration,
                                                       const MaintenanceScope &scope);

  [[nodiscard]] bool active(const std::string &service_id, common::TimePoint now) const;
  [[nodiscard]] bool any_active(common::TimePoint now) const;
  [[nodiscard]] std::vector<MaintenanceWindow> windows() const;

  /// Drops windows that ended before `now`.
  std::size_t prune(common::TimePoint now);
  void restore(std::vector<MaintenanceWindow> windows);

private:
  std::chrono::seconds manual_duration_;
  mutable std::mutex mutex_;
  std::vector<MaintenanceWindow> windows_;
  std::uint64_t next_id_ = 1;
};

} // namespace sato::maintenance
