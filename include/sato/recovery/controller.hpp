#pragma once

#include "sato/alerts/aggregator.hpp"
#include "sato/common/time.hpp"
#include "sato/maintenance/window_manager.hpp"
#include "sato/probe/service.hpp"
#include "sato/recovery/governor.hpp"
#include "sato/recovery/timer_queue.hpp"
#include "sato/status/classifier.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sato::recovery {

enum class AttemptOutcome { Success, Failure, SkippedRateLimited, SkippedMaintenance };

[[nodiscard]] std::string attempt_outcome_to_string(AttemptOutcome outcome);
[[nodiscard]] common::Result<AttemptOutcome> parse_attempt_outcome(const std::string &value);

struct RestartAttempt {
  std::string service_id;
  /// 1-based position within the incident.
  std::uint32_t index = 0;
  common::TimePoint scheduled_at{};
  std::optional<common::TimePoint> executed_at;
  AttemptOutcome outcome = AttemptOutcome::Failure;
  std::string detail;
  common::TimePoint incident_opened_at{};
};

enum class IncidentPhase { Active, Suppressed, Escalated, Recovering };

[[nodiscard]] std::string incident_phase_to_string(IncidentPhase phase);
[[nodiscard]] common::Result<IncidentPhase> parse_incident_phase(const std::string &value);

struct Incident {
  std::string service_id;
  common::TimePoint opened_at{};
  IncidentPhase phase = IncidentPhase::Active;
  /// Budget consumed: executed commands plus rate-limited skips.
  std::uint32_t attempts = 0;
  bool escalated = false;
  std::optional<common::TimePoint> recovered_at;
  TimerId timer = 0;
  std::optional<common::TimePoint> timer_due;
  bool in_flight = false;
};

struct RecoveryPolicy {
  bool enabled = true;
  std::vector<std::chrono::seconds> backoff = {std::chrono::seconds(30), std::chrono::seconds(60),
                                               std::chrono::seconds(120),
                                               std::chrono::seconds(300)};
  std::size_t attempt_history = 500;
};

/// A remediation the caller must execute outside the monitor lock and then
/// hand back to finish_attempt.
struct AttemptPlan {
  probe::Service service;
  std::uint32_t index = 0;
  common::TimePoint scheduled_at{};
  common::TimePoint incident_opened_at{};
};

using StateFn = std::function<status::ServiceState(const std::string &)>;

/// Owns incidents and their backoff timers. Not synchronized; the monitor
/// serializes calls.
class RecoveryController {
public:
  RecoveryController(RecoveryPolicy policy, const std::vector<probe::Service> &services,
                     FailureRateGovernor &governor, const maintenance::WindowManager &maintenance,
                     TimerQueue &timers, alerts::AlertAggregator &aggregator);

  void on_transition(const status::Transition &transition, common::TimePoint now);

  /// Puts a popped timer back unchanged when it could not be handled now.
  void defer(const DueTimer &timer);

  /// Called when a backoff timer fires and the service was re-probed.
  /// Returns a plan only when the remediation command should run now.
  [[nodiscard]] std::optional<AttemptPlan> begin_attempt(const DueTimer &timer,
                                                         status::ServiceState state,
                                                         common::TimePoint now);
  void finish_attempt(const AttemptPlan &plan, const common::Status &result,
                      common::TimePoint now);

  /// Closes incidents that stayed Operational for the cooldown and resumes
  /// suppressed ones once maintenance is over.
  void reconcile(common::TimePoint now, const StateFn &state);

  [[nodiscard]] const Incident *incident(const std::string &service_id) const;
  [[nodiscard]] const std::map<std::string, Incident> &incidents() const { return incidents_; }
  [[nodiscard]] const std::deque<RestartAttempt> &history() const { return history_; }
  [[nodiscard]] std::size_t in_flight() const;
  [[nodiscard]] std::chrono::seconds stage(std::uint32_t index) const;
  [[nodiscard]] std::chrono::seconds cooldown() const;

  /// Reloads persisted incidents and re-arms their timers.
  void restore(std::vector<Incident> incidents, std::vector<RestartAttempt> history,
               common::TimePoint now);

private:
  [[nodiscard]] const probe::Service *service(const std::string &service_id) const;
  [[nodiscard]] bool remediable(const probe::Service *service) const;
  void arm(Incident &incident, common::TimePoint due);
  void disarm(Incident &incident);
  void record(RestartAttempt attempt);

  RecoveryPolicy policy_;
  std::map<std::string, probe::Service> services_;
  FailureRateGovernor &governor_;
  const maintenance::WindowManager &maintenance_;
  TimerQueue &timers_;
  alerts::AlertAggregator &aggregator_;
  std::map<std::string, Incident> incidents_;
  std::deque<RestartAttempt> history_;
};

} // namespace sato::recovery
