#include "sato/observability/global.hpp"

#include <mutex>

namespace sato::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tick(const std::size_t probed, const std::size_t transitions,
                 const std::chrono::milliseconds duration) {
  record_event(TickEvent{.probed = probed, .transitions = transitions, .duration = duration});
}

void record_transition(const std::string &service, const std::string &from, const std::string &to,
                       const std::string &caused_by) {
  record_event(
      TransitionEvent{.service = service, .from = from, .to = to, .caused_by = caused_by});
}

void record_restart(const std::string &service, const std::uint32_t attempt,
                    const std::string &outcome, const std::string &detail) {
  record_event(RestartEvent{
      .service = service, .attempt = attempt, .outcome = outcome, .detail = detail});
}

void record_alert(const std::string &group_id, const std::string &root, const std::string &kind,
                  const bool suppressed) {
  record_event(
      AlertEvent{.group_id = group_id, .root = root, .kind = kind, .suppressed = suppressed});
}

void record_maintenance(const std::string &scope, const bool active) {
  record_event(MaintenanceEvent{.scope = scope, .active = active});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace sato::observability
