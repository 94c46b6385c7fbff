#include "sato/monitor/runtime.hpp"

#include "sato/config/config.hpp"
#include "sato/health/health.hpp"

#include <iostream>

namespace sato::monitor {

common::Result<std::unique_ptr<Runtime>> Runtime::create(const config::Config &config) {
  using RuntimeResult = common::Result<std::unique_ptr<Runtime>>;
  std::unique_ptr<Runtime> runtime(new Runtime());

  health::mark_component_starting("store");
  auto store = state::StateStore::open(config::state_path_candidates(config));
  if (!store.ok()) {
    health::mark_component_error("store", store.error());
    return RuntimeResult::failure(store.error());
  }
  runtime->store_ = std::move(store.value());
  health::mark_component_ok("store");
  if (runtime->store_->reinitialized()) {
    health::mark_component_error("store", "state was unreadable and has been reset");
  }

  runtime->http_ = std::make_shared<net::CurlHttpClient>();
  runtime->runner_ = std::make_shared<exec::ProcessRunner>();
  runtime->engine_ = std::make_shared<probe::ProbeEngine>(
      probe::ProbeEngineConfig{
          .max_concurrent_checks = config.monitor.max_concurrent_checks,
          .default_timeout = std::chrono::milliseconds(config.monitor.probe_timeout_ms),
          .history_limit = config.monitor.probe_history},
      probe::create_default_registry(runtime->http_, runtime->runner_), runtime->clock_);
  runtime->remediator_ = std::make_shared<recovery::CommandRemediator>(
      runtime->runner_, std::chrono::seconds(config.recovery.command_timeout_secs));
  runtime->notifier_ = alerts::create_notifier(config.alerts, runtime->http_);
  health::mark_component_ok("notifier");

  runtime->monitor_ = std::make_unique<Monitor>(
      config, MonitorDeps{.engine = runtime->engine_,
                          .remediator = runtime->remediator_,
                          .notifier = runtime->notifier_,
                          .store = runtime->store_.get(),
                          .clock = &runtime->clock_});
  for (const auto &warning : runtime->monitor_->warnings()) {
    std::cerr << "[monitor] warning: " << warning << "\n";
  }
  return RuntimeResult::success(std::move(runtime));
}

Runtime::~Runtime() {
  // The monitor refers to the notifier and store; tear it down first.
  monitor_.reset();
  notifier_.reset();
  store_.reset();
}

void Runtime::flush_notifications(const std::chrono::milliseconds timeout) {
  if (!notifier_->flush(timeout)) {
    std::cerr << "[monitor] warning: notifications still queued after flush timeout\n";
  }
}

} // namespace sato::monitor
