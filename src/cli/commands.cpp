#include "sato/cli/commands.hpp"

#include "sato/common/fs.hpp"
#include "sato/common/time.hpp"
#include "sato/config/config.hpp"
#include "sato/daemon/daemon.hpp"
#include "sato/daemon/pid_file.hpp"
#include "sato/graph/dependency_graph.hpp"
#include "sato/maintenance/window_manager.hpp"
#include "sato/monitor/runtime.hpp"
#include "sato/observability/factory.hpp"
#include "sato/observability/global.hpp"
#include "sato/state/state_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace sato::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int /*signal*/) { g_stop_requested = true; }

std::string version_string() {
#ifdef SATO_VERSION
  std::string version = SATO_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SATO_GIT_COMMIT
  const std::string commit = SATO_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "sato " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

bool parse_positive(const std::string &raw, std::uint64_t &out) {
  try {
    std::size_t used = 0;
    const auto value = std::stoull(raw, &used);
    if (used != raw.size() || value == 0) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

/// Loads and validates the config, printing warnings. Empty on hard errors.
std::optional<config::Config> load_valid_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "invalid config: " << validation.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg.value();
}

void install_observer(const config::Config &config) {
  observability::set_global_observer(observability::create_observer(config));
}

std::filesystem::path expanded(const std::string &path) {
  return std::filesystem::path(common::expand_path(path));
}

void print_help() {
  std::cout << "sato - self-healing service monitor\n\n"
            << "Usage: sato [--config PATH] <command> [options]\n\n"
            << "Commands:\n"
            << "  run [--duration-secs N]          Run the monitor daemon\n"
            << "  once                             Run a single probe tick and exit\n"
            << "  status                           Show persisted service and alert state\n"
            << "  ack <group-id> [--actor NAME]    Acknowledge an alert group\n"
            << "  maintenance on|off|toggle [--services a,b]\n"
            << "  maintenance schedule --start <unix> --minutes <n> [--services a,b]\n"
            << "  validate                         Check the configuration\n"
            << "  version                          Print version\n";
}

int run_daemon(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);

  const auto cfg = load_valid_config();
  if (!cfg.has_value()) {
    return 1;
  }
  install_observer(*cfg);

  auto runtime = monitor::Runtime::create(*cfg);
  if (!runtime.ok()) {
    std::cerr << "fatal: " << runtime.error() << "\n";
    return 2;
  }
  auto &monitor = runtime.value()->monitor();
  if (auto restored = monitor.restore(); !restored.ok()) {
    std::cerr << "fatal: " << restored.error() << "\n";
    return 2;
  }

  daemon::Daemon daemon(
      monitor, daemon::DaemonOptions{
                   .pid_file = expanded(cfg->state.pid_file),
                   .status_file = cfg->state.status_file.empty()
                                      ? std::filesystem::path()
                                      : expanded(cfg->state.status_file),
                   .drain_timeout = std::chrono::seconds(cfg->monitor.drain_timeout_secs),
                   .timer_poll = std::chrono::milliseconds(100),
                   .status_interval = std::chrono::seconds(5)});
  if (auto started = daemon.start(); !started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "Monitoring " << monitor.services().size() << " service(s); state at "
            << runtime.value()->store().path().string() << "\n";

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  std::uint64_t duration = 0;
  const bool bounded = !duration_raw.empty() && parse_positive(duration_raw, duration);
  if (!duration_raw.empty() && !bounded) {
    std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
  }
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (!g_stop_requested && (!bounded || std::chrono::steady_clock::now() < deadline)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  daemon.stop();
  runtime.value()->flush_notifications(std::chrono::seconds(5));
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

void print_status(const monitor::Monitor &monitor) {
  std::cout << std::left << std::setw(24) << "SERVICE" << std::setw(13) << "STATE"
            << std::setw(10) << "UPTIME" << std::setw(10) << "AVG_MS"
            << "NOTES\n";
  for (const auto &service : monitor.services()) {
    const auto record = monitor.record(service.id);
    std::string notes;
    if (const auto incident = monitor.incident(service.id); incident.has_value()) {
      notes += "incident=" + recovery::incident_phase_to_string(incident->phase) +
               " attempts=" + std::to_string(incident->attempts) + " ";
    }
    if (monitor.in_maintenance(service.id)) {
      notes += "maintenance ";
    }
    std::ostringstream uptime;
    std::ostringstream latency;
    if (record.has_value() && record->total_checks > 0) {
      uptime << std::fixed << std::setprecision(1) << record->uptime_percent() << "%";
      latency << std::fixed << std::setprecision(0) << record->average_latency_ms();
    } else {
      uptime << "-";
      latency << "-";
    }
    std::cout << std::left << std::setw(24) << service.id << std::setw(13)
              << status::state_to_string(monitor.state(service.id)) << std::setw(10)
              << uptime.str() << std::setw(10) << latency.str() << notes << "\n";
  }

  const auto groups = monitor.open_groups();
  std::cout << "\nOpen alert groups: " << groups.size() << "\n";
  for (const auto &group : groups) {
    std::cout << "  " << group.id << " root=" << group.root;
    if (!group.members.empty()) {
      std::cout << " members="
                << common::join(std::vector<std::string>(group.members.begin(),
                                                         group.members.end()),
                                ",");
    }
    std::cout << " since=" << common::format_rfc3339(group.first_seen);
    if (group.acknowledged) {
      std::cout << " acked_by=" << group.ack_actor;
    }
    if (group.escalated) {
      std::cout << " ESCALATED";
    }
    std::cout << "\n";
  }

  const auto windows = monitor.maintenance_windows();
  if (!windows.empty()) {
    std::cout << "\nMaintenance windows:\n";
    for (const auto &window : windows) {
      std::cout << "  #" << window.id << " scope=" << window.scope.to_string()
                << " start=" << common::format_rfc3339(window.start)
                << " end=" << common::format_rfc3339(window.end())
                << (window.manual ? " manual" : " scheduled") << "\n";
    }
  }
}

int run_once() {
  const auto cfg = load_valid_config();
  if (!cfg.has_value()) {
    return 1;
  }
  install_observer(*cfg);
  auto runtime = monitor::Runtime::create(*cfg);
  if (!runtime.ok()) {
    std::cerr << "fatal: " << runtime.error() << "\n";
    return 2;
  }
  auto &monitor = runtime.value()->monitor();
  if (auto restored = monitor.restore(); !restored.ok()) {
    std::cerr << "fatal: " << restored.error() << "\n";
    return 2;
  }
  const auto report = monitor.tick();
  for (const auto &transition : report.transitions) {
    std::cout << transition.service_id << ": " << status::state_to_string(transition.from)
              << " -> " << status::state_to_string(transition.to);
    if (transition.caused_by.has_value()) {
      std::cout << " (caused by " << *transition.caused_by << ")";
    }
    std::cout << "\n";
  }
  print_status(monitor);
  runtime.value()->flush_notifications(std::chrono::seconds(5));
  return 0;
}

int run_status() {
  const auto cfg = load_valid_config();
  if (!cfg.has_value()) {
    return 1;
  }
  auto runtime = monitor::Runtime::create(*cfg);
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 2;
  }
  auto &monitor = runtime.value()->monitor();
  if (auto restored = monitor.restore(); !restored.ok()) {
    std::cerr << restored.error() << "\n";
    return 1;
  }

  if (const auto pid = daemon::PidFile::running_pid(expanded(cfg->state.pid_file));
      pid.has_value()) {
    std::cout << "Daemon: running (pid " << *pid << ")\n";
  } else {
    std::cout << "Daemon: not running\n";
  }
  std::cout << "State: " << runtime.value()->store().path().string() << "\n\n";
  print_status(monitor);
  return 0;
}

/// Operator controls go through the state store queue so a running daemon
/// picks them up on its next tick; without a daemon they apply directly.
int submit_action(const state::OperatorAction &action) {
  const auto cfg = load_valid_config();
  if (!cfg.has_value()) {
    return 1;
  }
  auto runtime = monitor::Runtime::create(*cfg);
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 2;
  }

  if (daemon::PidFile::running_pid(expanded(cfg->state.pid_file)).has_value()) {
    if (auto queued = runtime.value()->store().enqueue_action(action); !queued.ok()) {
      std::cerr << "failed to queue action: " << queued.error() << "\n";
      return 1;
    }
    std::cout << "Queued " << state::action_kind_to_string(action.kind)
              << " for the running daemon\n";
    return 0;
  }

  auto &monitor = runtime.value()->monitor();
  if (auto restored = monitor.restore(); !restored.ok()) {
    std::cerr << restored.error() << "\n";
    return 1;
  }
  if (action.kind == state::ActionKind::Acknowledge) {
    auto status = monitor.acknowledge(action.target, action.actor);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "Acknowledged " << action.target << "\n";
    return 0;
  }
  auto scope = maintenance::MaintenanceScope::parse(action.target);
  if (!scope.ok()) {
    std::cerr << scope.error() << "\n";
    return 1;
  }
  if (action.kind == state::ActionKind::Schedule) {
    auto id = monitor.schedule_maintenance(action.start.value_or(std::chrono::system_clock::now()),
                                           action.duration, scope.value());
    if (!id.ok()) {
      std::cerr << id.error() << "\n";
      return 1;
    }
    std::cout << "Scheduled maintenance window #" << id.value() << "\n";
    return 0;
  }
  if (action.kind == state::ActionKind::MaintenanceToggle) {
    const bool on = monitor.toggle_maintenance(scope.value());
    std::cout << "Maintenance " << (on ? "on" : "off") << " for " << scope.value().to_string()
              << "\n";
    return 0;
  }
  const bool on = action.kind == state::ActionKind::MaintenanceOn;
  monitor.set_maintenance(scope.value(), on);
  std::cout << "Maintenance " << (on ? "on" : "off") << " for " << scope.value().to_string()
            << "\n";
  return 0;
}

int run_ack(std::vector<std::string> args) {
  std::string actor;
  (void)take_option(args, "--actor", "-a", actor);
  if (args.empty()) {
    std::cerr << "usage: sato ack <group-id> [--actor NAME]\n";
    return 1;
  }
  if (actor.empty()) {
    const char *user = std::getenv("USER");
    actor = user != nullptr && *user != '\0' ? user : "operator";
  }
  return submit_action(state::OperatorAction{.id = 0,
                                             .kind = state::ActionKind::Acknowledge,
                                             .target = args[0],
                                             .actor = actor,
                                             .start = std::nullopt,
                                             .duration = std::chrono::seconds(0),
                                             .queued_at = std::chrono::system_clock::now()});
}

int run_maintenance(std::vector<std::string> args) {
  std::string services;
  (void)take_option(args, "--services", "-s", services);
  if (args.empty()) {
    std::cerr << "usage: sato maintenance on|off|toggle|schedule [options]\n";
    return 1;
  }
  const std::string sub = args[0];
  args.erase(args.begin());

  if (auto scope = maintenance::MaintenanceScope::parse(services); !scope.ok()) {
    std::cerr << scope.error() << "\n";
    return 1;
  }

  state::OperatorAction action{.id = 0,
                               .kind = state::ActionKind::MaintenanceOn,
                               .target = services.empty() ? "*" : services,
                               .actor = "",
                               .start = std::nullopt,
                               .duration = std::chrono::seconds(0),
                               .queued_at = std::chrono::system_clock::now()};
  if (sub == "on") {
    action.kind = state::ActionKind::MaintenanceOn;
  } else if (sub == "off") {
    action.kind = state::ActionKind::MaintenanceOff;
  } else if (sub == "toggle") {
    action.kind = state::ActionKind::MaintenanceToggle;
  } else if (sub == "schedule") {
    std::string start_raw;
    std::string minutes_raw;
    (void)take_option(args, "--start", "", start_raw);
    (void)take_option(args, "--minutes", "", minutes_raw);
    std::uint64_t minutes = 0;
    if (!parse_positive(minutes_raw, minutes)) {
      std::cerr << "--minutes must be a positive integer\n";
      return 1;
    }
    action.kind = state::ActionKind::Schedule;
    action.duration = std::chrono::minutes(minutes);
    if (!start_raw.empty()) {
      auto start = common::parse_unix_seconds(start_raw);
      if (!start.ok()) {
        std::cerr << start.error() << "\n";
        return 1;
      }
      action.start = start.value();
    }
  } else {
    std::cerr << "unknown maintenance command: " << sub << "\n";
    return 1;
  }
  return submit_action(action);
}

int run_validate() {
  const auto cfg = load_valid_config();
  if (!cfg.has_value()) {
    return 1;
  }
  const auto build = graph::build_graph(cfg->services, cfg->groups);
  for (const auto &warning : build.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  std::cout << "Config OK: " << cfg->services.size() << " service(s), "
            << build.graph.edge_count() << " dependency edge(s)\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "once") {
    return run_once();
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "ack") {
    return run_ack(std::move(args));
  }
  if (subcommand == "maintenance") {
    return run_maintenance(std::move(args));
  }
  if (subcommand == "validate") {
    return run_validate();
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sato::cli
