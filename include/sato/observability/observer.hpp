#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sato::observability {

struct TickEvent {
  std::size_t probed = 0;
  std::size_t transitions = 0;
  std::chrono::milliseconds duration{0};
};

struct TransitionEvent {
  std::string service;
  std::string from;
  std::string to;
  std::string caused_by;
};

struct RestartEvent {
  std::string service;
  std::uint32_t attempt = 0;
  std::string outcome;
  std::string detail;
};

struct AlertEvent {
  std::string group_id;
  std::string root;
  std::string kind;
  bool suppressed = false;
};

struct MaintenanceEvent {
  std::string scope;
  bool active = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<TickEvent, TransitionEvent, RestartEvent, AlertEvent,
                                   MaintenanceEvent, ErrorEvent>;

struct ProbeLatencyMetric {
  std::string service;
  std::chrono::milliseconds latency{0};
};

struct OpenGroupsMetric {
  std::uint64_t count = 0;
};

struct PendingTimersMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ProbeLatencyMetric, OpenGroupsMetric, PendingTimersMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sato::observability
