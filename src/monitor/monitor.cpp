#include "sato/monitor/monitor.hpp"

#include "sato/common/json_util.hpp"
#include "sato/exec/command_runner.hpp"
#include "sato/health/health.hpp"
#include "sato/net/http_client.hpp"
#include "sato/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace sato::monitor {

namespace {

const common::Clock &system_clock() {
  static const common::SystemClock clock;
  return clock;
}

MonitorDeps with_defaults(MonitorDeps deps, const config::Config &config) {
  if (deps.clock == nullptr) {
    deps.clock = &system_clock();
  }
  std::shared_ptr<exec::CommandRunner> runner;
  if (deps.engine == nullptr || deps.remediator == nullptr) {
    runner = std::make_shared<exec::ProcessRunner>();
  }
  if (deps.engine == nullptr) {
    deps.engine = std::make_shared<probe::ProbeEngine>(
        probe::ProbeEngineConfig{
            .max_concurrent_checks = config.monitor.max_concurrent_checks,
            .default_timeout = std::chrono::milliseconds(config.monitor.probe_timeout_ms),
            .history_limit = config.monitor.probe_history},
        probe::create_default_registry(std::make_shared<net::CurlHttpClient>(), runner),
        *deps.clock);
  }
  if (deps.remediator == nullptr) {
    deps.remediator = std::make_shared<recovery::CommandRemediator>(
        runner, std::chrono::seconds(config.recovery.command_timeout_secs));
  }
  if (deps.notifier == nullptr) {
    deps.notifier = std::make_shared<alerts::LogNotifier>();
  }
  return deps;
}

status::ClassifierConfig classifier_config(const config::MonitorSettings &m) {
  return status::ClassifierConfig{
      .down_after_failures = m.down_after_failures,
      .degraded_recovery_successes = m.degraded_recovery_successes,
      .down_recovery_successes = m.down_recovery_successes,
      .degraded_latency = std::chrono::milliseconds(m.degraded_latency_ms),
      .latency_history = m.latency_history};
}

graph::CorrelatorConfig correlator_config(const config::Config &config) {
  return graph::CorrelatorConfig{
      .correlation_window = std::chrono::seconds(config.alerts.correlation_window_secs),
      .default_interval = std::chrono::seconds(config.monitor.tick_interval_secs),
      .root_down_interval = std::chrono::seconds(config.monitor.root_down_interval_secs),
      .root_fast_window = std::chrono::seconds(config.monitor.root_fast_window_secs)};
}

recovery::RecoveryPolicy recovery_policy(const config::RecoveryConfig &config) {
  recovery::RecoveryPolicy policy;
  policy.enabled = config.enabled;
  policy.backoff.clear();
  for (const auto secs : config.backoff_secs) {
    policy.backoff.emplace_back(secs);
  }
  policy.attempt_history = config.attempt_history;
  return policy;
}

void append_group_json(std::ostringstream &json, const alerts::AlertGroup &group) {
  json << "{\"id\":\"" << common::json_escape(group.id) << "\",";
  json << "\"root\":\"" << common::json_escape(group.root) << "\",";
  json << "\"members\":[";
  bool first = true;
  for (const auto &member : group.members) {
    json << (first ? "" : ",") << "\"" << common::json_escape(member) << "\"";
    first = false;
  }
  json << "],";
  json << "\"first_seen\":\"" << common::format_rfc3339(group.first_seen) << "\",";
  json << "\"last_seen\":\"" << common::format_rfc3339(group.last_seen) << "\",";
  json << "\"acknowledged\":" << (group.acknowledged ? "true" : "false") << ",";
  if (group.acknowledged) {
    json << "\"ack_actor\":\"" << common::json_escape(group.ack_actor) << "\",";
  }
  json << "\"escalated\":" << (group.escalated ? "true" : "false") << "}";
}

} // namespace

Monitor::Monitor(config::Config config, MonitorDeps deps)
    : config_(std::move(config)), deps_(with_defaults(std::move(deps), config_)),
      clock_(*deps_.clock), build_(graph::build_graph(config_.services, config_.groups)),
      classifier_(classifier_config(config_.monitor)),
      correlator_(build_.graph, correlator_config(config_)),
      maintenance_(std::chrono::minutes(config_.maintenance.manual_duration_minutes)),
      governor_(config_.governor.max_restarts, std::chrono::seconds(config_.governor.window_secs)),
      aggregator_(*deps_.notifier, maintenance_),
      controller_(recovery_policy(config_.recovery), build_.services, governor_, maintenance_,
                  timers_, aggregator_) {
  for (const auto &service : build_.services) {
    classifier_.track(service.id);
    next_probe_[service.id] = common::TimePoint{};
  }
}

const probe::Service *Monitor::find_service(const std::string &service_id) const {
  const auto it = std::find_if(build_.services.begin(), build_.services.end(),
                               [&](const probe::Service &s) { return s.id == service_id; });
  return it == build_.services.end() ? nullptr : &*it;
}

common::Status Monitor::restore() {
  if (deps_.store == nullptr) {
    return common::Status::success();
  }
  auto loaded = deps_.store->load();
  if (!loaded.ok()) {
    std::cerr << "[monitor] warning: state load failed (" << loaded.error()
              << "); reinitializing store\n";
    if (auto reset = deps_.store->reinitialize(); !reset.ok()) {
      return common::Status::error("state reinitialize failed: " + reset.error());
    }
    health::mark_component_error("store", "state was unreadable and has been reset");
    return common::Status::success();
  }
  auto &snapshot = loaded.value();
  const auto now = clock_.now();

  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t restored = 0;
  for (auto &[id, record] : snapshot.statuses) {
    // Rows for services no longer configured are dropped at the next checkpoint.
    if (find_service(id) == nullptr) {
      continue;
    }
    classifier_.restore(id, std::move(record));
    ++restored;
  }
  for (const auto &[id, at] : snapshot.down_since) {
    if (find_service(id) != nullptr) {
      correlator_.restore_down_since(id, at);
    }
  }
  for (auto &window : snapshot.failure_windows) {
    governor_.restore(window.service_id, std::move(window.stamps), window.suppressing);
  }
  maintenance_.restore(std::move(snapshot.maintenance));
  aggregator_.restore(std::move(snapshot.open_groups), std::move(snapshot.archived_groups));
  for (const auto &service : build_.services) {
    const auto current = classifier_.state(service.id);
    if ((current == status::ServiceState::Down || current == status::ServiceState::Degraded) &&
        aggregator_.group_for(service.id) == nullptr) {
      aggregator_.hold(service.id);
    }
  }

  std::vector<recovery::Incident> incidents;
  for (auto &incident : snapshot.incidents) {
    if (find_service(incident.service_id) != nullptr) {
      incidents.push_back(std::move(incident));
    }
  }
  controller_.restore(std::move(incidents), std::move(snapshot.attempts), now);

  std::cerr << "[monitor] restored services=" << restored
            << " incidents=" << controller_.incidents().size()
            << " open_groups=" << aggregator_.open_groups().size()
            << " timers=" << timers_.size() << "\n";
  return common::Status::success();
}

status::ServiceState Monitor::state_locked(const std::string &service_id) const {
  return classifier_.state(service_id);
}

void Monitor::handle_transitions_locked(std::vector<status::Transition> &transitions,
                                        const common::TimePoint now, TickReport *report) {
  correlator_.attribute(transitions);
  for (const auto &transition : transitions) {
    observability::record_transition(transition.service_id,
                                     status::state_to_string(transition.from),
                                     status::state_to_string(transition.to),
                                     transition.caused_by.value_or(""));
    controller_.on_transition(transition, now);
  }
  auto opened = aggregator_.process(transitions, now);
  if (report != nullptr) {
    report->opened_groups.insert(report->opened_groups.end(), opened.begin(), opened.end());
  }
}

TickReport Monitor::tick() {
  const auto started = std::chrono::steady_clock::now();
  TickReport report;
  auto now = clock_.now();
  report.operator_actions = apply_operator_actions(now);

  std::vector<probe::Service> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &service : build_.services) {
      if (next_probe_[service.id] <= now) {
        due.push_back(service);
      }
    }
  }

  auto results = deps_.engine->run_batch(due);
  report.probed = results.size();
  now = clock_.now();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto transitions = classifier_.classify(results);
    handle_transitions_locked(transitions, now, &report);

    const auto lookup = [this](const std::string &id) { return state_locked(id); };
    controller_.reconcile(now, lookup);
    open_after_maintenance_locked(now, report);
    aggregator_.close_resolved(lookup, now);
    maintenance_.prune(now);

    for (const auto &service : due) {
      next_probe_[service.id] = now + correlator_.probe_interval(service.id, now);
    }
    report.transitions = std::move(transitions);
    checkpoint_locked();

    observability::record_metric(
        observability::OpenGroupsMetric{.count = aggregator_.open_groups().size()});
  }
  observability::record_metric(observability::PendingTimersMetric{.count = timers_.size()});
  observability::record_tick(report.probed, report.transitions.size(),
                             std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started));
  return report;
}

void Monitor::open_after_maintenance_locked(const common::TimePoint now, TickReport &report) {
  const auto lookup = [this](const std::string &id) { return state_locked(id); };
  const auto released = aggregator_.release_held(lookup, now);
  if (released.empty()) {
    return;
  }
  std::vector<status::Transition> pending;
  for (const auto &id : released) {
    const auto current = classifier_.state(id);
    pending.push_back(status::Transition{.service_id = id,
                                         .from = current,
                                         .to = current,
                                         .at = now,
                                         .caused_by = correlator_.root_cause(id)});
  }
  std::cerr << "[monitor] maintenance ended with " << pending.size()
            << " service(s) still impaired\n";
  auto opened = aggregator_.process(pending, now);
  report.opened_groups.insert(report.opened_groups.end(), opened.begin(), opened.end());
}

std::size_t Monitor::fire_due_timers() {
  std::size_t issued = 0;
  if (stopping_) {
    return issued;
  }
  for (const auto &timer : timers_.pop_due(clock_.now())) {
    std::optional<probe::Service> service;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto *incident = controller_.incident(timer.service_id);
      const auto *found = find_service(timer.service_id);
      if (incident == nullptr || incident->timer != timer.id || found == nullptr) {
        continue;
      }
      if (stopping_) {
        controller_.defer(timer);
        continue;
      }
      service = *found;
    }

    // Out-of-band re-probe before deciding on a command.
    const auto result = deps_.engine->run_one(*service);

    std::optional<recovery::AttemptPlan> plan;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto now = clock_.now();
      auto transitions = classifier_.classify({result});
      handle_transitions_locked(transitions, now, nullptr);
      if (stopping_) {
        // Shutdown began during the check; the timer survives for the next run.
        controller_.defer(timer);
      } else {
        plan = controller_.begin_attempt(timer, classifier_.state(timer.service_id), now);
        if (plan.has_value()) {
          ++in_flight_;
        }
      }
      checkpoint_locked();
    }
    if (!plan.has_value()) {
      continue;
    }

    const auto outcome = deps_.remediator->execute(plan->service, &cancel_);
    --in_flight_;
    ++issued;

    std::lock_guard<std::mutex> lock(mutex_);
    controller_.finish_attempt(*plan, outcome, clock_.now());
    checkpoint_locked();
  }
  return issued;
}

std::size_t Monitor::apply_operator_actions(const common::TimePoint now) {
  if (deps_.store == nullptr) {
    return 0;
  }
  auto actions = deps_.store->take_actions();
  if (!actions.ok()) {
    observability::record_error("store", "reading operator actions: " + actions.error());
    return 0;
  }
  if (actions.value().empty()) {
    return 0;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &action : actions.value()) {
    if (auto status = apply_action_locked(action, now); !status.ok()) {
      std::cerr << "[monitor] operator action " << state::action_kind_to_string(action.kind)
                << " failed: " << status.error() << "\n";
    }
  }
  checkpoint_locked();
  return actions.value().size();
}

common::Status Monitor::apply_action_locked(const state::OperatorAction &action,
                                            const common::TimePoint now) {
  if (action.kind == state::ActionKind::Acknowledge) {
    const std::string actor = action.actor.empty() ? "operator" : action.actor;
    return aggregator_.acknowledge(action.target, actor, now);
  }

  auto scope = maintenance::MaintenanceScope::parse(action.target);
  if (!scope.ok()) {
    return scope.status();
  }
  switch (action.kind) {
  case state::ActionKind::MaintenanceOn:
    maintenance_.set_manual(scope.value(), true, now);
    observability::record_maintenance(scope.value().to_string(), true);
    break;
  case state::ActionKind::MaintenanceOff:
    maintenance_.set_manual(scope.value(), false, now);
    observability::record_maintenance(scope.value().to_string(), false);
    break;
  case state::ActionKind::MaintenanceToggle: {
    const bool on = maintenance_.toggle_now(scope.value(), now);
    observability::record_maintenance(scope.value().to_string(), on);
    break;
  }
  case state::ActionKind::Schedule: {
    auto scheduled = maintenance_.schedule(action.start.value_or(now), action.duration,
                                           scope.value());
    if (!scheduled.ok()) {
      return scheduled.status();
    }
    break;
  }
  case state::ActionKind::Acknowledge:
    break;
  }
  return common::Status::success();
}

common::Status Monitor::acknowledge(const std::string &group_id, const std::string &actor) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = aggregator_.acknowledge(group_id, actor, clock_.now());
  if (status.ok()) {
    checkpoint_locked();
  }
  return status;
}

bool Monitor::toggle_maintenance(const maintenance::MaintenanceScope &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool on = maintenance_.toggle_now(scope, clock_.now());
  observability::record_maintenance(scope.to_string(), on);
  checkpoint_locked();
  return on;
}

void Monitor::set_maintenance(const maintenance::MaintenanceScope &scope, const bool on) {
  std::lock_guard<std::mutex> lock(mutex_);
  maintenance_.set_manual(scope, on, clock_.now());
  observability::record_maintenance(scope.to_string(), on);
  checkpoint_locked();
}

common::Result<std::uint64_t>
Monitor::schedule_maintenance(const common::TimePoint start, const std::chrono::seconds duration,
                              const maintenance::MaintenanceScope &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = maintenance_.schedule(start, duration, scope);
  if (id.ok()) {
    checkpoint_locked();
  }
  return id;
}

status::ServiceState Monitor::state(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return classifier_.state(service_id);
}

std::optional<status::StatusRecord> Monitor::record(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto *found = classifier_.record(service_id);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

std::vector<alerts::AlertGroup> Monitor::open_groups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aggregator_.open_groups();
}

std::vector<alerts::AlertGroup> Monitor::archived_groups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aggregator_.archived();
}

std::optional<recovery::Incident> Monitor::incident(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto *found = controller_.incident(service_id);
  if (found == nullptr) {
    return std::nullopt;
  }
  return *found;
}

std::vector<recovery::RestartAttempt> Monitor::attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<recovery::RestartAttempt>(controller_.history().begin(),
                                               controller_.history().end());
}

std::vector<maintenance::MaintenanceWindow> Monitor::maintenance_windows() const {
  return maintenance_.windows();
}

bool Monitor::in_maintenance(const std::string &service_id) const {
  return maintenance_.active(service_id, clock_.now());
}

std::size_t Monitor::restart_window(const std::string &service_id) const {
  return governor_.window(service_id).size();
}

std::uint64_t Monitor::notifications_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aggregator_.notifications_sent();
}

std::chrono::milliseconds Monitor::driver_interval() const {
  const auto tick = std::chrono::seconds(std::max<std::uint32_t>(1, config_.monitor.tick_interval_secs));
  const auto fast =
      std::chrono::seconds(std::max<std::uint32_t>(1, config_.monitor.root_down_interval_secs));
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::min(tick, fast));
}

void Monitor::set_stopping(const bool stopping) {
  std::lock_guard<std::mutex> lock(mutex_);
  stopping_ = stopping;
  if (!stopping) {
    cancel_ = false;
  }
}

void Monitor::abandon_in_flight() {
  if (in_flight_ > 0) {
    std::cerr << "[monitor] abandoning " << in_flight_.load() << " remediation command(s)\n";
  }
  cancel_ = true;
}

state::StateSnapshot Monitor::snapshot_locked() const {
  state::StateSnapshot snapshot;
  snapshot.statuses = classifier_.records();
  for (const auto &service : build_.services) {
    if (const auto since = correlator_.down_since(service.id); since.has_value()) {
      snapshot.down_since[service.id] = *since;
    }
  }
  for (const auto &[id, incident] : controller_.incidents()) {
    snapshot.incidents.push_back(incident);
  }
  snapshot.attempts.assign(controller_.history().begin(), controller_.history().end());
  for (const auto &id : governor_.services()) {
    snapshot.failure_windows.push_back(state::FailureWindowSnapshot{
        .service_id = id, .stamps = governor_.window(id), .suppressing = governor_.suppressing(id)});
  }
  snapshot.open_groups = aggregator_.open_groups();
  snapshot.archived_groups = aggregator_.archived();
  snapshot.maintenance = maintenance_.windows();
  return snapshot;
}

void Monitor::checkpoint_locked() {
  if (deps_.store == nullptr) {
    return;
  }
  if (auto status = deps_.store->save(snapshot_locked()); !status.ok()) {
    observability::record_error("store", "checkpoint failed: " + status.error());
  }
}

common::Status Monitor::checkpoint() {
  if (deps_.store == nullptr) {
    return common::Status::success();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return deps_.store->save(snapshot_locked());
}

std::string Monitor::status_json() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_.now();
  std::ostringstream json;
  json << "{\"generated_at\":\"" << common::format_rfc3339(now) << "\",";

  json << "\"services\":[";
  bool first = true;
  for (const auto &service : build_.services) {
    json << (first ? "" : ",");
    first = false;
    const auto *record = classifier_.record(service.id);
    json << "{\"id\":\"" << common::json_escape(service.id) << "\",";
    json << "\"check_type\":\"" << probe::check_type_to_string(service.check_type) << "\",";
    json << "\"state\":\"" << status::state_to_string(classifier_.state(service.id)) << "\",";
    json << "\"maintenance\":" << (maintenance_.active(service.id, now) ? "true" : "false");
    if (record != nullptr) {
      json << ",\"consecutive_failures\":" << record->consecutive_failures;
      json << ",\"uptime_percent\":" << record->uptime_percent();
      json << ",\"average_latency_ms\":" << record->average_latency_ms();
      json << ",\"latencies_ms\":[";
      for (std::size_t i = 0; i < record->latencies_ms.size(); ++i) {
        json << (i == 0 ? "" : ",") << record->latencies_ms[i];
      }
      json << "]";
    }
    if (const auto *incident = controller_.incident(service.id); incident != nullptr) {
      json << ",\"incident\":{\"phase\":\""
           << recovery::incident_phase_to_string(incident->phase)
           << "\",\"attempts\":" << incident->attempts << "}";
    }
    json << "}";
  }
  json << "],";

  json << "\"groups\":[";
  first = true;
  for (const auto &group : aggregator_.open_groups()) {
    json << (first ? "" : ",");
    first = false;
    append_group_json(json, group);
  }
  json << "],";

  json << "\"maintenance\":[";
  first = true;
  for (const auto &window : maintenance_.windows()) {
    json << (first ? "" : ",");
    first = false;
    json << "{\"id\":" << window.id << ",\"scope\":\"" << common::json_escape(window.scope.to_string())
         << "\",\"start\":\"" << common::format_rfc3339(window.start) << "\",\"end\":\""
         << common::format_rfc3339(window.end()) << "\",\"manual\":"
         << (window.manual ? "true" : "false")
         << ",\"active\":" << (window.active_at(now) ? "true" : "false") << "}";
  }
  json << "],";
  json << "\"pending_timers\":" << timers_.size();
  json << "}";
  return json.str();
}

} // namespace sato::monitor
