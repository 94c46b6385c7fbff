#pragma once

#include "sato/common/clock.hpp"
#include "sato/probe/probe.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sato::probe {

struct ProbeEngineConfig {
  std::size_t max_concurrent_checks = 10;
  std::chrono::milliseconds default_timeout{5000};
  std::size_t history_limit = 50;
};

/// Runs one check per service per batch on a bounded pool of workers and
/// keeps a short append-only history of results per service.
class ProbeEngine {
public:
  ProbeEngine(ProbeEngineConfig config, std::shared_ptr<ProbeRegistry> registry,
              const common::Clock &clock);

  /// Blocks until every check finished or timed out. Results come back in
  /// the order of `services`.
  [[nodiscard]] std::vector<ProbeResult> run_batch(const std::vector<Service> &services);

  /// Out-of-band check used by backoff timers.
  [[nodiscard]] ProbeResult run_one(const Service &service);

  [[nodiscard]] std::vector<ProbeResult> history(const std::string &service_id) const;

private:
  [[nodiscard]] ProbeResult execute(const Service &service) const;
  void append_history(const ProbeResult &result);

  ProbeEngineConfig config_;
  std::shared_ptr<ProbeRegistry> registry_;
  const common::Clock &clock_;
  mutable std::mutex history_mutex_;
  std::unordered_map<std::string, std::deque<ProbeResult>> history_;
};

} // namespace sato::probe
