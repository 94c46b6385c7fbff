#include "sato/recovery/controller.hpp"

#include "sato/observability/global.hpp"

#include <algorithm>
#include <iostream>

namespace sato::recovery {

std::string attempt_outcome_to_string(const AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::Success:
    return "success";
  case AttemptOutcome::Failure:
    return "failure";
  case AttemptOutcome::SkippedRateLimited:
    return "skipped-rate-limited";
  case AttemptOutcome::SkippedMaintenance:
    return "skipped-maintenance";
  }
  return "failure";
}

common::Result<AttemptOutcome> parse_attempt_outcome(const std::string &value) {
  for (const auto outcome : {AttemptOutcome::Success, AttemptOutcome::Failure,
                             AttemptOutcome::SkippedRateLimited,
                             AttemptOutcome::SkippedMaintenance}) {
    if (attempt_outcome_to_string(outcome) == value) {
      return common::Result<AttemptOutcome>::success(outcome);
    }
  }
  return common::Result<AttemptOutcome>::failure("unknown attempt outcome: " + value);
}

std::string incident_phase_to_string(const IncidentPhase phase) {
  switch (phase) {
  case IncidentPhase::Active:
    return "active";
  case IncidentPhase::Suppressed:
    return "suppressed";
  case IncidentPhase::Escalated:
    return "escalated";
  case IncidentPhase::Recovering:
    return "recovering";
  }
  return "active";
}

common::Result<IncidentPhase> parse_incident_phase(const std::string &value) {
  for (const auto phase : {IncidentPhase::Active, IncidentPhase::Suppressed,
                           IncidentPhase::Escalated, IncidentPhase::Recovering}) {
    if (incident_phase_to_string(phase) == value) {
      return common::Result<IncidentPhase>::success(phase);
    }
  }
  return common::Result<IncidentPhase>::failure("unknown incident phase: " + value);
}

RecoveryController::RecoveryController(RecoveryPolicy policy,
                                       const std::vector<probe::Service> &services,
                                       FailureRateGovernor &governor,
                                       const maintenance::WindowManager &maintenance,
                                       TimerQueue &timers, alerts::AlertAggregator &aggregator)
    : policy_(std::move(policy)), governor_(governor), maintenance_(maintenance), timers_(timers),
      aggregator_(aggregator) {
  if (policy_.backoff.empty()) {
    policy_.backoff.push_back(std::chrono::seconds(0));
  }
  for (const auto &service : services) {
    services_[service.id] = service;
  }
}

std::chrono::seconds RecoveryController::stage(const std::uint32_t index) const {
  const auto last = policy_.backoff.size() - 1;
  return policy_.backoff[std::min<std::size_t>(index, last)];
}

std::chrono::seconds RecoveryController::cooldown() const { return policy_.backoff.back(); }

const probe::Service *RecoveryController::service(const std::string &service_id) const {
  const auto it = services_.find(service_id);
  return it == services_.end() ? nullptr : &it->second;
}

bool RecoveryController::remediable(const probe::Service *service) const {
  return policy_.enabled && service != nullptr && service->remediation_command.has_value() &&
         !service->external;
}

void RecoveryController::arm(Incident &incident, const common::TimePoint due) {
  disarm(incident);
  incident.timer = timers_.schedule(incident.service_id, due);
  incident.timer_due = due;
}

void RecoveryController::disarm(Incident &incident) {
  if (incident.timer != 0) {
    timers_.cancel(incident.timer);
  }
  incident.timer = 0;
  incident.timer_due.reset();
}

void RecoveryController::record(RestartAttempt attempt) {
  observability::record_restart(attempt.service_id, attempt.index,
                                attempt_outcome_to_string(attempt.outcome), attempt.detail);
  history_.push_back(std::move(attempt));
  while (history_.size() > policy_.attempt_history) {
    history_.pop_front();
  }
}

void RecoveryController::on_transition(const status::Transition &transition,
                                       const common::TimePoint now) {
  const std::string &id = transition.service_id;

  if (transition.to == status::ServiceState::Operational) {
    const auto it = incidents_.find(id);
    if (it == incidents_.end()) {
      return;
    }
    disarm(it->second);
    it->second.phase = IncidentPhase::Recovering;
    it->second.recovered_at = now;
    return;
  }
  if (transition.to != status::ServiceState::Down) {
    return;
  }

  const auto *svc = service(id);
  if (!remediable(svc)) {
    return;
  }

  auto it = incidents_.find(id);
  if (it != incidents_.end() && it->second.phase != IncidentPhase::Recovering) {
    // Still inside the same incident (e.g. Down -> Degraded -> Down).
    return;
  }

  if (it == incidents_.end()) {
    Incident incident;
    incident.service_id = id;
    incident.opened_at = now;
    it = incidents_.emplace(id, std::move(incident)).first;
    std::cerr << "[recovery] incident opened service=" << id << "\n";
  } else {
    it->second.recovered_at.reset();
    std::cerr << "[recovery] incident resumed service=" << id
              << " attempts=" << it->second.attempts << "\n";
  }

  Incident &incident = it->second;
  if (incident.escalated) {
    incident.phase = IncidentPhase::Escalated;
    return;
  }
  if (maintenance_.active(id, now)) {
    incident.phase = IncidentPhase::Suppressed;
    record(RestartAttempt{.service_id = id,
                          .index = incident.attempts + 1,
                          .scheduled_at = now,
                          .executed_at = std::nullopt,
                          .outcome = AttemptOutcome::SkippedMaintenance,
                          .detail = "maintenance window active",
                          .incident_opened_at = incident.opened_at});
    return;
  }
  incident.phase = IncidentPhase::Active;
  arm(incident, now + stage(incident.attempts));
}

void RecoveryController::defer(const DueTimer &timer) {
  const auto it = incidents_.find(timer.service_id);
  if (it == incidents_.end() || it->second.timer != timer.id) {
    return;
  }
  arm(it->second, timer.due);
}

std::optional<AttemptPlan> RecoveryController::begin_attempt(const DueTimer &timer,
                                                             const status::ServiceState state,
                                                             const common::TimePoint now) {
  const auto it = incidents_.find(timer.service_id);
  if (it == incidents_.end() || it->second.timer != timer.id) {
    return std::nullopt;
  }
  Incident &incident = it->second;
  incident.timer = 0;
  incident.timer_due.reset();
  if (incident.phase != IncidentPhase::Active) {
    return std::nullopt;
  }

  const auto *svc = service(timer.service_id);
  if (!remediable(svc)) {
    return std::nullopt;
  }

  if (state != status::ServiceState::Down) {
    // Degraded or unknown: wait another stage before deciding.
    arm(incident, now + stage(incident.attempts));
    return std::nullopt;
  }

  if (maintenance_.active(svc->id, now)) {
    // Escalation waits too; reconcile re-arms the incident once the window ends.
    incident.phase = IncidentPhase::Suppressed;
    if (incident.attempts < svc->max_restart_attempts) {
      record(RestartAttempt{.service_id = svc->id,
                            .index = incident.attempts + 1,
                            .scheduled_at = timer.due,
                            .executed_at = std::nullopt,
                            .outcome = AttemptOutcome::SkippedMaintenance,
                            .detail = "maintenance window active",
                            .incident_opened_at = incident.opened_at});
    }
    return std::nullopt;
  }

  if (incident.attempts >= svc->max_restart_attempts) {
    incident.phase = IncidentPhase::Escalated;
    incident.escalated = true;
    std::cerr << "[recovery] escalating service=" << svc->id
              << " attempts=" << incident.attempts << "\n";
    aggregator_.escalate(svc->id, now);
    return std::nullopt;
  }

  const auto decision = governor_.check_at(svc->id, now);
  if (!decision.allowed) {
    ++incident.attempts;
    record(RestartAttempt{.service_id = svc->id,
                          .index = incident.attempts,
                          .scheduled_at = timer.due,
                          .executed_at = std::nullopt,
                          .outcome = AttemptOutcome::SkippedRateLimited,
                          .detail = std::to_string(decision.in_window) + " restarts within " +
                                    std::to_string(governor_.window_length().count()) + "s",
                          .incident_opened_at = incident.opened_at});
    if (decision.new_episode) {
      std::cerr << "[recovery] rate limit reached service=" << svc->id << "\n";
      aggregator_.rate_limited(svc->id, now);
    }
    arm(incident, now + stage(incident.attempts));
    return std::nullopt;
  }

  incident.in_flight = true;
  return AttemptPlan{.service = *svc,
                     .index = incident.attempts + 1,
                     .scheduled_at = timer.due,
                     .incident_opened_at = incident.opened_at};
}

void RecoveryController::finish_attempt(const AttemptPlan &plan, const common::Status &result,
                                        const common::TimePoint now) {
  governor_.record_at(plan.service.id, now);
  record(RestartAttempt{.service_id = plan.service.id,
                        .index = plan.index,
                        .scheduled_at = plan.scheduled_at,
                        .executed_at = now,
                        .outcome = result.ok() ? AttemptOutcome::Success : AttemptOutcome::Failure,
                        .detail = result.ok() ? "command completed" : result.error(),
                        .incident_opened_at = plan.incident_opened_at});
  std::cerr << "[recovery] attempt service=" << plan.service.id << " index=" << plan.index
            << " outcome=" << (result.ok() ? "success" : "failure") << "\n";

  const auto it = incidents_.find(plan.service.id);
  if (it == incidents_.end()) {
    return;
  }
  Incident &incident = it->second;
  incident.in_flight = false;
  incident.attempts = std::max(incident.attempts, plan.index);
  if (incident.phase == IncidentPhase::Active) {
    arm(incident, now + stage(incident.attempts));
  }
}

void RecoveryController::reconcile(const common::TimePoint now, const StateFn &state) {
  for (auto it = incidents_.begin(); it != incidents_.end();) {
    Incident &incident = it->second;
    const auto current = state(incident.service_id);

    if (incident.phase == IncidentPhase::Recovering) {
      if (current != status::ServiceState::Operational) {
        incident.recovered_at.reset();
      } else if (!incident.recovered_at.has_value()) {
        incident.recovered_at = now;
      } else if (!incident.in_flight && now - *incident.recovered_at >= cooldown()) {
        std::cerr << "[recovery] incident closed service=" << incident.service_id
                  << " attempts=" << incident.attempts << "\n";
        it = incidents_.erase(it);
        continue;
      }
    } else if (incident.phase == IncidentPhase::Suppressed &&
               !maintenance_.active(incident.service_id, now)) {
      incident.phase = IncidentPhase::Active;
      arm(incident, now + stage(incident.attempts));
    }
    ++it;
  }
}

const Incident *RecoveryController::incident(const std::string &service_id) const {
  const auto it = incidents_.find(service_id);
  return it == incidents_.end() ? nullptr : &it->second;
}

std::size_t RecoveryController::in_flight() const {
  return static_cast<std::size_t>(std::count_if(
      incidents_.begin(), incidents_.end(),
      [](const auto &entry) { return entry.second.in_flight; }));
}

void RecoveryController::restore(std::vector<Incident> incidents,
                                 std::vector<RestartAttempt> history,
                                 const common::TimePoint now) {
  for (auto &[id, incident] : incidents_) {
    disarm(incident);
  }
  incidents_.clear();
  history_.clear();
  for (auto &attempt : history) {
    history_.push_back(std::move(attempt));
  }
  while (history_.size() > policy_.attempt_history) {
    history_.pop_front();
  }

  for (auto &incident : incidents) {
    incident.timer = 0;
    incident.in_flight = false;
    const auto due = incident.timer_due;
    incident.timer_due.reset();
    auto &stored = incidents_[incident.service_id];
    stored = std::move(incident);
    if (stored.phase == IncidentPhase::Active) {
      arm(stored, due.value_or(now + stage(stored.attempts)));
    }
  }
}

} // namespace sato::recovery
