#pragma once

#include "sato/observability/observer.hpp"

#include <memory>

namespace sato::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tick(std::size_t probed, std::size_t transitions, std::chrono::milliseconds duration);
void record_transition(const std::string &service, const std::string &from, const std::string &to,
                       const std::string &caused_by = "");
void record_restart(const std::string &service, std::uint32_t attempt, const std::string &outcome,
                    const std::string &detail = "");
void record_alert(const std::string &group_id, const std::string &root, const std::string &kind,
                  bool suppressed);
void record_maintenance(const std::string &scope, bool active);
void record_error(const std::string &component, const std::string &message);

} // namespace sato::observability
