#include "sato/probe/engine.hpp"

#include "sato/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <system_error>
#include <thread>

namespace sato::probe {

ProbeEngine::ProbeEngine(ProbeEngineConfig config, std::shared_ptr<ProbeRegistry> registry,
                         const common::Clock &clock)
    : config_(config), registry_(std::move(registry)), clock_(clock) {
  if (config_.max_concurrent_checks == 0) {
    config_.max_concurrent_checks = 1;
  }
}

ProbeResult ProbeEngine::execute(const Service &service) const {
  ProbeResult result;
  result.service_id = service.id;

  IProbe *probe = registry_ == nullptr ? nullptr : registry_->find(service.check_type);
  if (probe == nullptr) {
    result.timestamp = clock_.now();
    result.error = "no probe for check type " + check_type_to_string(service.check_type);
    return result;
  }

  const auto timeout = service.timeout.value_or(config_.default_timeout);
  const auto started = std::chrono::steady_clock::now();
  ProbeOutcome outcome;
  try {
    outcome = probe->check(service, timeout);
  } catch (const std::exception &ex) {
    outcome = ProbeOutcome{.success = false, .error = std::string("probe error: ") + ex.what()};
    observability::record_error("probe", service.id + ": " + ex.what());
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  result.timestamp = clock_.now();
  result.success = outcome.success;
  result.error = std::move(outcome.error);
  result.latency = outcome.latency.value_or(elapsed);
  // A check that overran its deadline is a timeout even if it reported success.
  if (result.success && !outcome.latency.has_value() && elapsed > timeout) {
    result.success = false;
    result.error = "timeout";
  }
  return result;
}

void ProbeEngine::append_history(const ProbeResult &result) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  auto &entries = history_[result.service_id];
  entries.push_back(result);
  while (entries.size() > config_.history_limit) {
    entries.pop_front();
  }
}

std::vector<ProbeResult> ProbeEngine::run_batch(const std::vector<Service> &services) {
  std::vector<ProbeResult> results(services.size());
  if (services.empty()) {
    return results;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    while (true) {
      const std::size_t index = next.fetch_add(1);
      if (index >= services.size()) {
        return;
      }
      results[index] = execute(services[index]);
    }
  };

  const std::size_t worker_count = std::min(config_.max_concurrent_checks, services.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    try {
      workers.emplace_back(worker);
    } catch (const std::system_error &err) {
      std::cerr << "[probe] worker spawn failed: " << err.what() << "\n";
      break;
    }
  }
  if (workers.empty()) {
    worker();
  }
  for (auto &thread : workers) {
    thread.join();
  }

  for (const auto &result : results) {
    append_history(result);
    observability::record_metric(
        observability::ProbeLatencyMetric{.service = result.service_id, .latency = result.latency});
  }
  return results;
}

ProbeResult ProbeEngine::run_one(const Service &service) {
  auto result = execute(service);
  append_history(result);
  return result;
}

std::vector<ProbeResult> ProbeEngine::history(const std::string &service_id) const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  const auto it = history_.find(service_id);
  if (it == history_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

} // namespace sato::probe
