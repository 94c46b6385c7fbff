#include "sato/graph/correlator.hpp"

#include <deque>
#include <set>

namespace sato::graph {

CascadeCorrelator::CascadeCorrelator(const DependencyGraph &graph, CorrelatorConfig config)
    : graph_(graph), config_(config) {}

void CascadeCorrelator::attribute(std::vector<status::Transition> &batch) {
  // Record the whole batch first so siblings from the same tick see each
  // other regardless of order.
  for (const auto &transition : batch) {
    if (transition.to == status::ServiceState::Down) {
      down_since_[transition.service_id] = transition.at;
    } else {
      down_since_.erase(transition.service_id);
    }
    if (transition.to == status::ServiceState::Down ||
        transition.to == status::ServiceState::Degraded) {
      impaired_at_[transition.service_id] = transition.at;
    } else {
      impaired_at_.erase(transition.service_id);
    }
  }

  for (auto &transition : batch) {
    if (transition.to != status::ServiceState::Down &&
        transition.to != status::ServiceState::Degraded) {
      continue;
    }
    if (auto cause = topmost_cause(transition.service_id, transition.at); cause.has_value()) {
      transition.caused_by = std::move(cause);
    }
  }
}

std::optional<std::string> CascadeCorrelator::root_cause(const std::string &service_id) const {
  const auto it = impaired_at_.find(service_id);
  if (it == impaired_at_.end()) {
    return std::nullopt;
  }
  return topmost_cause(service_id, it->second);
}

std::optional<std::string> CascadeCorrelator::topmost_cause(const std::string &service_id,
                                                            const common::TimePoint at) const {
  auto cause = nearest_cause(service_id, at);
  if (!cause.has_value()) {
    return std::nullopt;
  }
  // Walk up while the cause is itself explained by something further up.
  std::set<std::string> seen = {service_id};
  while (seen.insert(*cause).second) {
    auto upstream = nearest_cause(*cause, at);
    if (!upstream.has_value()) {
      break;
    }
    cause = upstream;
  }
  return cause;
}

std::optional<std::string> CascadeCorrelator::nearest_cause(const std::string &service_id,
                                                            const common::TimePoint at) const {
  std::deque<std::string> queue(graph_.parents(service_id).begin(),
                                graph_.parents(service_id).end());
  std::set<std::string> visited;
  while (!queue.empty()) {
    const std::string candidate = queue.front();
    queue.pop_front();
    if (!visited.insert(candidate).second) {
      continue;
    }
    if (const auto it = impaired_at_.find(candidate); it != impaired_at_.end()) {
      const auto gap = at - it->second;
      if (gap >= -config_.correlation_window && gap <= config_.correlation_window) {
        return candidate;
      }
    }
    for (const auto &parent : graph_.parents(candidate)) {
      queue.push_back(parent);
    }
  }
  return std::nullopt;
}

std::chrono::seconds CascadeCorrelator::probe_interval(const std::string &service_id,
                                                       const common::TimePoint now) const {
  if (!graph_.has_dependents(service_id)) {
    return config_.default_interval;
  }
  const auto it = down_since_.find(service_id);
  if (it == down_since_.end() || now - it->second >= config_.root_fast_window) {
    return config_.default_interval;
  }
  return config_.root_down_interval;
}

std::optional<common::TimePoint> CascadeCorrelator::down_since(const std::string &service_id) const {
  const auto it = down_since_.find(service_id);
  if (it == down_since_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void CascadeCorrelator::restore_down_since(const std::string &service_id,
                                           const common::TimePoint at) {
  down_since_[service_id] = at;
  impaired_at_[service_id] = at;
}

} // namespace sato::graph
