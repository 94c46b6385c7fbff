#pragma once

#include "sato/alerts/notifier.hpp"
#include "sato/common/clock.hpp"
#include "sato/config/schema.hpp"
#include "sato/monitor/monitor.hpp"
#include "sato/state/state_store.hpp"

#include <memory>

namespace sato::monitor {

/// Owns the production collaborators (curl, process runner, probes, state
/// store, notifier) and the monitor built on them.
class Runtime {
public:
  /// Fails only when no state store location is usable.
  [[nodiscard]] static common::Result<std::unique_ptr<Runtime>> create(const config::Config &config);

  ~Runtime();
  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] Monitor &monitor() { return *monitor_; }
  [[nodiscard]] state::StateStore &store() { return *store_; }
  [[nodiscard]] alerts::INotifier &notifier() { return *notifier_; }

  /// Waits briefly for queued webhook deliveries.
  void flush_notifications(std::chrono::milliseconds timeout);

private:
  Runtime() = default;

  common::SystemClock clock_;
  std::shared_ptr<net::HttpClient> http_;
  std::shared_ptr<exec::CommandRunner> runner_;
  std::shared_ptr<probe::ProbeEngine> engine_;
  std::shared_ptr<recovery::IRemediator> remediator_;
  std::shared_ptr<alerts::INotifier> notifier_;
  std::unique_ptr<state::StateStore> store_;
  std::unique_ptr<Monitor> monitor_;
};

} // namespace sato::monitor
