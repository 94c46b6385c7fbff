#include "sato/recovery/governor.hpp"

#include <algorithm>

namespace sato::recovery {

FailureRateGovernor::FailureRateGovernor(const std::uint32_t max_attempts,
                                         const std::chrono::seconds window)
    : max_attempts_(max_attempts), window_(window) {}

void FailureRateGovernor::prune_locked(std::vector<common::TimePoint> &stamps,
                                       const common::TimePoint now) const {
  const auto cutoff = now - window_;
  stamps.erase(std::remove_if(stamps.begin(), stamps.end(),
                              [cutoff](const auto &t) { return t <= cutoff; }),
               stamps.end());
}

GovernorDecision FailureRateGovernor::check_at(const std::string &service_id,
                                               const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stamps = windows_[service_id];
  prune_locked(stamps, now);

  GovernorDecision decision;
  decision.in_window = stamps.size();
  decision.allowed = stamps.size() < static_cast<std::size_t>(max_attempts_);
  if (decision.allowed) {
    suppressing_.erase(service_id);
  } else {
    decision.new_episode = suppressing_.insert(service_id).second;
  }
  return decision;
}

void FailureRateGovernor::record_at(const std::string &service_id, const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stamps = windows_[service_id];
  prune_locked(stamps, now);
  stamps.push_back(now);
}

std::size_t FailureRateGovernor::count_at(const std::string &service_id,
                                          const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stamps = windows_[service_id];
  prune_locked(stamps, now);
  return stamps.size();
}

std::vector<common::TimePoint> FailureRateGovernor::window(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = windows_.find(service_id);
  if (it == windows_.end()) {
    return {};
  }
  return it->second;
}

bool FailureRateGovernor::suppressing(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressing_.contains(service_id);
}

std::vector<std::string> FailureRateGovernor::services() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto &[id, stamps] : windows_) {
    if (!stamps.empty() || suppressing_.contains(id)) {
      out.push_back(id);
    }
  }
  return out;
}

void FailureRateGovernor::restore(const std::string &service_id,
                                  std::vector<common::TimePoint> stamps, const bool suppressing) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::sort(stamps.begin(), stamps.end());
  windows_[service_id] = std::move(stamps);
  if (suppressing) {
    suppressing_.insert(service_id);
  } else {
    suppressing_.erase(service_id);
  }
}

} // namespace sato::recovery
