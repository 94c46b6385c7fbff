#pragma once

#include "sato/common/result.hpp"
#include "sato/common/time.hpp"
#include "sato/probe/service.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sato::status {

enum class ServiceState { Checking, Operational, Degraded, Down };

[[nodiscard]] std::string state_to_string(ServiceState state);
[[nodiscard]] common::Result<ServiceState> parse_state(const std::string &value);

struct StatusRecord {
  ServiceState state = ServiceState::Checking;
  std::uint32_t consecutive_failures = 0;
  /// Fast successes only; slow ones do not count toward recovery.
  std::uint32_t consecutive_successes = 0;
  common::TimePoint last_transition{};
  std::deque<std::int64_t> latencies_ms;
  std::uint64_t total_checks = 0;
  std::uint64_t successful_checks = 0;
  std::uint64_t total_latency_ms = 0;

  [[nodiscard]] double uptime_percent() const;
  [[nodiscard]] double average_latency_ms() const;
};

struct Transition {
  std::string service_id;
  ServiceState from = ServiceState::Checking;
  ServiceState to = ServiceState::Checking;
  common::TimePoint at{};
  /// Set by cascade attribution when an upstream root explains this change.
  std::optional<std::string> caused_by;
};

struct ClassifierConfig {
  std::uint32_t down_after_failures = 2;
  std::uint32_t degraded_recovery_successes = 1;
  std::uint32_t down_recovery_successes = 1;
  std::chrono::milliseconds degraded_latency{1000};
  std::size_t latency_history = 100;
};

/// Sole owner of per-service lifecycle state. Not synchronized; callers
/// serialize access.
class StatusClassifier {
public:
  explicit StatusClassifier(ClassifierConfig config);

  void track(const std::string &service_id);
  void restore(const std::string &service_id, StatusRecord record);

  [[nodiscard]] std::optional<Transition> apply(const probe::ProbeResult &result);
  [[nodiscard]] std::vector<Transition> classify(const std::vector<probe::ProbeResult> &batch);

  [[nodiscard]] ServiceState state(const std::string &service_id) const;
  [[nodiscard]] const StatusRecord *record(const std::string &service_id) const;
  [[nodiscard]] const std::map<std::string, StatusRecord> &records() const { return records_; }

private:
  [[nodiscard]] ServiceState next_state(const StatusRecord &record, bool success,
                                        bool slow) const;

  ClassifierConfig config_;
  std::map<std::string, StatusRecord> records_;
};

} // namespace sato::status
