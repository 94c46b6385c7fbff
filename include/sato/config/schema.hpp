#pragma once

#include "sato/probe/service.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sato::config {

struct MonitorSettings {
  std::uint32_t tick_interval_secs = 15;
  std::uint32_t root_down_interval_secs = 5;
  std::uint32_t root_fast_window_secs = 600;
  std::uint32_t probe_timeout_ms = 5000;
  std::uint32_t max_concurrent_checks = 10;
  std::uint32_t degraded_latency_ms = 1000;
  std::uint32_t down_after_failures = 2;
  std::uint32_t degraded_recovery_successes = 1;
  std::uint32_t down_recovery_successes = 1;
  std::uint32_t latency_history = 100;
  std::uint32_t probe_history = 50;
  std::uint32_t drain_timeout_secs = 30;
};

struct RecoveryConfig {
  bool enabled = true;
  /// Waits before successive attempts; the last entry doubles as the quiet
  /// period that closes an incident.
  std::vector<std::uint32_t> backoff_secs = {30, 60, 120, 300};
  std::uint32_t max_restart_attempts = 3;
  std::uint32_t command_timeout_secs = 60;
  std::uint32_t attempt_history = 500;
};

struct GovernorConfig {
  std::uint32_t max_restarts = 5;
  std::uint32_t window_secs = 3600;
};

struct AlertsConfig {
  std::uint32_t correlation_window_secs = 60;
  std::string webhook_url;
  std::string webhook_format = "generic";
  std::string webhook_secret;
  std::uint32_t webhook_timeout_ms = 10000;
  bool log_notifications = true;
};

struct MaintenanceConfig {
  std::uint32_t manual_duration_minutes = 60;
};

struct StateConfig {
  std::string path = "~/.sato/state.db";
  std::vector<std::string> fallback_paths = {"/var/tmp/sato/state.db"};
  std::string status_file = "~/.sato/status.json";
  std::string pid_file = "~/.sato/sato.pid";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

/// Co-located deployment units reported by discovery (e.g. one compose
/// project). Without an explicit root the members share a synthetic one.
struct GroupConfig {
  std::string name;
  std::string root;
  std::vector<std::string> members;
};

struct Config {
  MonitorSettings monitor;
  RecoveryConfig recovery;
  GovernorConfig governor;
  AlertsConfig alerts;
  MaintenanceConfig maintenance;
  StateConfig state;
  ObservabilityConfig observability;
  std::vector<probe::Service> services;
  std::vector<GroupConfig> groups;
};

} // namespace sato::config
