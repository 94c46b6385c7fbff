#pragma once

#include "sato/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sato::recovery {

struct GovernorDecision {
  bool allowed = true;
  /// First denial after an allowed check: the caller raises one alert.
  bool new_episode = false;
  std::size_t in_window = 0;
};

/// Rolling per-service cap on remediation attempts. Timestamps older than the
/// window are pruned on every access, never in fixed buckets.
class FailureRateGovernor {
public:
  explicit FailureRateGovernor(std::uint32_t max_attempts = 5,
                               std::chrono::seconds window = std::chrono::hours(1));

  [[nodiscard]] GovernorDecision check_at(const std::string &service_id, common::TimePoint now);
  void record_at(const std::string &service_id, common::TimePoint now);
  [[nodiscard]] std::size_t count_at(const std::string &service_id, common::TimePoint now);

  [[nodiscard]] std::vector<common::TimePoint> window(const std::string &service_id) const;
  [[nodiscard]] bool suppressing(const std::string &service_id) const;
  [[nodiscard]] std::vector<std::string> services() const;

  void restore(const std::string &service_id, std::vector<common::TimePoint> stamps,
               bool suppressing);

  [[nodiscard]] std::uint32_t max_attempts() const { return max_attempts_; }
  [[nodiscard]] std::chrono::seconds window_length() const { return window_; }

private:
  void prune_locked(std::vector<common::TimePoint> &stamps, common::TimePoint now) const;

  std::uint32_t max_attempts_;
  std::chrono::seconds window_;
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<common::TimePoint>> windows_;
  std::set<std::string> suppressing_;
};

} // namespace sato::recovery
