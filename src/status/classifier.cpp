#include "sato/status/classifier.hpp"

#include "sato/common/fs.hpp"

namespace sato::status {

std::string state_to_string(const ServiceState state) {
  switch (state) {
  case ServiceState::Checking:
    return "checking";
  case ServiceState::Operational:
    return "operational";
  case ServiceState::Degraded:
    return "degraded";
  case ServiceState::Down:
    return "down";
  }
  return "checking";
}

common::Result<ServiceState> parse_state(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "checking") {
    return common::Result<ServiceState>::success(ServiceState::Checking);
  }
  if (normalized == "operational") {
    return common::Result<ServiceState>::success(ServiceState::Operational);
  }
  if (normalized == "degraded") {
    return common::Result<ServiceState>::success(ServiceState::Degraded);
  }
  if (normalized == "down") {
    return common::Result<ServiceState>::success(ServiceState::Down);
  }
  return common::Result<ServiceState>::failure("unknown service state: " + value);
}

double StatusRecord::uptime_percent() const {
  if (total_checks == 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(successful_checks) / static_cast<double>(total_checks);
}

double StatusRecord::average_latency_ms() const {
  if (successful_checks == 0) {
    return 0.0;
  }
  return static_cast<double>(total_latency_ms) / static_cast<double>(successful_checks);
}

StatusClassifier::StatusClassifier(ClassifierConfig config) : config_(config) {
  if (config_.down_after_failures == 0) {
    config_.down_after_failures = 1;
  }
}

void StatusClassifier::track(const std::string &service_id) { (void)records_[service_id]; }

void StatusClassifier::restore(const std::string &service_id, StatusRecord record) {
  while (record.latencies_ms.size() > config_.latency_history) {
    record.latencies_ms.pop_front();
  }
  records_[service_id] = std::move(record);
}

ServiceState StatusClassifier::next_state(const StatusRecord &record, const bool success,
                                          const bool slow) const {
  const ServiceState current = record.state;
  if (!success) {
    if (record.consecutive_failures >= config_.down_after_failures) {
      return ServiceState::Down;
    }
    return current == ServiceState::Down ? ServiceState::Down : ServiceState::Degraded;
  }

  switch (current) {
  case ServiceState::Checking:
    return slow ? ServiceState::Degraded : ServiceState::Operational;
  case ServiceState::Operational:
    return slow ? ServiceState::Degraded : ServiceState::Operational;
  case ServiceState::Degraded:
    if (!slow && record.consecutive_successes >= config_.degraded_recovery_successes) {
      return ServiceState::Operational;
    }
    return ServiceState::Degraded;
  case ServiceState::Down:
    if (slow) {
      return ServiceState::Degraded;
    }
    if (record.consecutive_successes >= config_.down_recovery_successes) {
      return ServiceState::Operational;
    }
    return ServiceState::Down;
  }
  return current;
}

std::optional<Transition> StatusClassifier::apply(const probe::ProbeResult &result) {
  auto &record = records_[result.service_id];
  const bool slow = result.success && result.latency > config_.degraded_latency;

  ++record.total_checks;
  if (result.success) {
    ++record.successful_checks;
    record.total_latency_ms += static_cast<std::uint64_t>(result.latency.count());
    record.latencies_ms.push_back(result.latency.count());
    while (record.latencies_ms.size() > config_.latency_history) {
      record.latencies_ms.pop_front();
    }
    record.consecutive_failures = 0;
    record.consecutive_successes = slow ? 0 : record.consecutive_successes + 1;
  } else {
    record.consecutive_successes = 0;
    ++record.consecutive_failures;
  }

  const ServiceState next = next_state(record, result.success, slow);
  if (next == record.state) {
    return std::nullopt;
  }

  Transition transition{.service_id = result.service_id,
                        .from = record.state,
                        .to = next,
                        .at = result.timestamp,
                        .caused_by = std::nullopt};
  record.state = next;
  record.last_transition = result.timestamp;
  return transition;
}

std::vector<Transition> StatusClassifier::classify(const std::vector<probe::ProbeResult> &batch) {
  std::vector<Transition> transitions;
  for (const auto &result : batch) {
    if (auto transition = apply(result); transition.has_value()) {
      transitions.push_back(std::move(*transition));
    }
  }
  return transitions;
}

ServiceState StatusClassifier::state(const std::string &service_id) const {
  const auto it = records_.find(service_id);
  return it == records_.end() ? ServiceState::Checking : it->second.state;
}

const StatusRecord *StatusClassifier::record(const std::string &service_id) const {
  const auto it = records_.find(service_id);
  return it == records_.end() ? nullptr : &it->second;
}

} // namespace sato::status
