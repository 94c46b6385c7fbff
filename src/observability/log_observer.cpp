#include "sato/observability/log_observer.hpp"

#include "sato/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace sato::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << common::now_rfc3339() << " [" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, TickEvent>) {
          log_line("DEBUG", "tick probed=" + std::to_string(evt.probed) +
                                " transitions=" + std::to_string(evt.transitions) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, TransitionEvent>) {
          std::string line = "status.transition service=" + evt.service + " from=" + evt.from +
                             " to=" + evt.to;
          if (!evt.caused_by.empty()) {
            line += " caused_by=" + evt.caused_by;
          }
          log_line(evt.to == "down" ? "WARN" : "INFO", line);
        } else if constexpr (std::is_same_v<T, RestartEvent>) {
          std::string line = "recovery.attempt service=" + evt.service +
                             " attempt=" + std::to_string(evt.attempt) + " outcome=" + evt.outcome;
          if (!evt.detail.empty()) {
            line += " detail=\"" + evt.detail + "\"";
          }
          log_line(evt.outcome == "success" ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, AlertEvent>) {
          log_line("INFO", "alert." + evt.kind + " group=" + evt.group_id + " root=" + evt.root +
                               (evt.suppressed ? " suppressed=true" : ""));
        } else if constexpr (std::is_same_v<T, MaintenanceEvent>) {
          log_line("INFO", "maintenance scope=" + evt.scope +
                               " active=" + (evt.active ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProbeLatencyMetric>) {
          log_line("DEBUG", "metric.probe_latency_ms service=" + m.service +
                                " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OpenGroupsMetric>) {
          log_line("DEBUG", "metric.open_alert_groups=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, PendingTimersMetric>) {
          log_line("DEBUG", "metric.pending_timers=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace sato::observability
