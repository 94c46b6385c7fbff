#pragma once

#include "sato/alerts/aggregator.hpp"
#include "sato/common/clock.hpp"
#include "sato/config/schema.hpp"
#include "sato/graph/correlator.hpp"
#include "sato/graph/dependency_graph.hpp"
#include "sato/maintenance/window_manager.hpp"
#include "sato/probe/engine.hpp"
#include "sato/recovery/controller.hpp"
#include "sato/recovery/governor.hpp"
#include "sato/recovery/remediator.hpp"
#include "sato/recovery/timer_queue.hpp"
#include "sato/state/state_store.hpp"
#include "sato/status/classifier.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sato::monitor {

struct MonitorDeps {
  std::shared_ptr<probe::ProbeEngine> engine;
  std::shared_ptr<recovery::IRemediator> remediator;
  std::shared_ptr<alerts::INotifier> notifier;
  /// Optional; without it nothing is persisted.
  state::StateStore *store = nullptr;
  /// Defaults to the system clock.
  const common::Clock *clock = nullptr;
};

struct TickReport {
  std::size_t probed = 0;
  std::vector<status::Transition> transitions;
  std::vector<std::string> opened_groups;
  std::size_t operator_actions = 0;
};

/// Wires the control loop: probe batch, classification, cascade attribution,
/// recovery, alerting and persistence. Safe to drive from a tick thread and a
/// timer thread at once; probes and remediation commands run unlocked.
class Monitor {
public:
  Monitor(config::Config config, MonitorDeps deps);

  /// Loads the persisted snapshot and re-arms pending timers.
  [[nodiscard]] common::Status restore();

  TickReport tick();

  /// Fires every due backoff timer: re-probe, then maybe remediate.
  /// Returns the number of remediation commands issued.
  std::size_t fire_due_timers();

  [[nodiscard]] common::Status acknowledge(const std::string &group_id, const std::string &actor);
  bool toggle_maintenance(const maintenance::MaintenanceScope &scope);
  void set_maintenance(const maintenance::MaintenanceScope &scope, bool on);
  [[nodiscard]] common::Result<std::uint64_t>
  schedule_maintenance(common::TimePoint start, std::chrono::seconds duration,
                       const maintenance::MaintenanceScope &scope);

  /// Configured services plus synthetic group roots.
  [[nodiscard]] const std::vector<probe::Service> &services() const { return build_.services; }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return build_.warnings; }
  [[nodiscard]] const graph::DependencyGraph &graph() const { return build_.graph; }

  [[nodiscard]] status::ServiceState state(const std::string &service_id) const;
  [[nodiscard]] std::optional<status::StatusRecord> record(const std::string &service_id) const;
  [[nodiscard]] std::vector<alerts::AlertGroup> open_groups() const;
  [[nodiscard]] std::vector<alerts::AlertGroup> archived_groups() const;
  [[nodiscard]] std::optional<recovery::Incident> incident(const std::string &service_id) const;
  [[nodiscard]] std::vector<recovery::RestartAttempt> attempts() const;
  [[nodiscard]] std::vector<maintenance::MaintenanceWindow> maintenance_windows() const;
  [[nodiscard]] bool in_maintenance(const std::string &service_id) const;
  [[nodiscard]] std::size_t restart_window(const std::string &service_id) const;
  [[nodiscard]] std::size_t pending_timers() const { return timers_.size(); }
  [[nodiscard]] std::optional<common::TimePoint> next_timer_due() const {
    return timers_.next_due();
  }
  [[nodiscard]] std::uint64_t notifications_sent() const;

  [[nodiscard]] std::string status_json() const;

  /// Granularity the tick driver should run at so shortened root intervals
  /// are honored.
  [[nodiscard]] std::chrono::milliseconds driver_interval() const;

  [[nodiscard]] std::size_t in_flight() const { return in_flight_; }
  /// While set, due timers are left armed and no new command starts.
  void set_stopping(bool stopping);
  /// Cancels running remediation commands; used when the drain times out.
  void abandon_in_flight();

  [[nodiscard]] common::Status checkpoint();

private:
  [[nodiscard]] status::ServiceState state_locked(const std::string &service_id) const;
  void handle_transitions_locked(std::vector<status::Transition> &transitions,
                                 common::TimePoint now, TickReport *report);
  void open_after_maintenance_locked(common::TimePoint now, TickReport &report);
  std::size_t apply_operator_actions(common::TimePoint now);
  [[nodiscard]] common::Status apply_action_locked(const state::OperatorAction &action,
                                                   common::TimePoint now);
  [[nodiscard]] state::StateSnapshot snapshot_locked() const;
  void checkpoint_locked();
  [[nodiscard]] const probe::Service *find_service(const std::string &service_id) const;

  config::Config config_;
  MonitorDeps deps_;
  const common::Clock &clock_;
  graph::GraphBuild build_;
  status::StatusClassifier classifier_;
  graph::CascadeCorrelator correlator_;
  maintenance::WindowManager maintenance_;
  recovery::FailureRateGovernor governor_;
  recovery::TimerQueue timers_;
  alerts::AlertAggregator aggregator_;
  recovery::RecoveryController controller_;
  std::map<std::string, common::TimePoint> next_probe_;

  mutable std::mutex mutex_;
  std::atomic<bool> cancel_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace sato::monitor
