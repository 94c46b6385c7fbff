#include "sato/config/config.hpp"

#include "sato/common/fs.hpp"
#include "sato/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace sato::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sato";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SATO_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const auto value = doc.get_u64(key, fallback);
  if (value > 0xFFFFFFFFULL) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

void load_monitor_settings(MonitorSettings &m, const common::TomlDocument &doc) {
  m.tick_interval_secs = get_u32(doc, "monitor.tick_interval_secs", m.tick_interval_secs);
  m.root_down_interval_secs =
      get_u32(doc, "monitor.root_down_interval_secs", m.root_down_interval_secs);
  m.root_fast_window_secs = get_u32(doc, "monitor.root_fast_window_secs", m.root_fast_window_secs);
  m.probe_timeout_ms = get_u32(doc, "monitor.probe_timeout_ms", m.probe_timeout_ms);
  m.max_concurrent_checks = get_u32(doc, "monitor.max_concurrent_checks", m.max_concurrent_checks);
  m.degraded_latency_ms = get_u32(doc, "monitor.degraded_latency_ms", m.degraded_latency_ms);
  m.down_after_failures = get_u32(doc, "monitor.down_after_failures", m.down_after_failures);
  m.degraded_recovery_successes =
      get_u32(doc, "monitor.degraded_recovery_successes", m.degraded_recovery_successes);
  m.down_recovery_successes =
      get_u32(doc, "monitor.down_recovery_successes", m.down_recovery_successes);
  m.latency_history = get_u32(doc, "monitor.latency_history", m.latency_history);
  m.probe_history = get_u32(doc, "monitor.probe_history", m.probe_history);
  m.drain_timeout_secs = get_u32(doc, "monitor.drain_timeout_secs", m.drain_timeout_secs);
}

common::Status load_services(Config &config, const common::TomlDocument &doc) {
  for (const auto &id : doc.child_tables("services")) {
    const std::string prefix = "services." + id + ".";
    probe::Service service;
    service.id = id;

    auto type = probe::parse_check_type(doc.get_string(prefix + "check_type", "http"));
    if (!type.ok()) {
      return common::Status::error("service '" + id + "': " + type.error());
    }
    service.check_type = type.value();
    service.target = expand_config_value(doc.get_string(prefix + "target"));

    const std::string remediation = common::trim(doc.get_string(prefix + "remediation_command"));
    if (!remediation.empty()) {
      service.remediation_command = remediation;
    }
    service.max_restart_attempts = get_u32(doc, prefix + "max_restart_attempts",
                                           config.recovery.max_restart_attempts);
    service.depends_on = doc.get_string_array(prefix + "depends_on");
    if (doc.has(prefix + "timeout_ms")) {
      service.timeout = std::chrono::milliseconds(get_u32(doc, prefix + "timeout_ms", 0));
    }
    for (const auto code : doc.get_u64_array(prefix + "expected_status")) {
      if (code < 100 || code > 599) {
        return common::Status::error("service '" + id +
                                     "': expected_status out of range: " + std::to_string(code));
      }
      service.expected_status.push_back(static_cast<std::uint16_t>(code));
    }
    service.external = doc.get_bool(prefix + "external", false);
    service.group = doc.get_string(prefix + "group");
    config.services.push_back(std::move(service));
  }
  return common::Status::success();
}

void load_groups(Config &config, const common::TomlDocument &doc) {
  std::set<std::string> seen;
  for (const auto &name : doc.child_tables("groups")) {
    GroupConfig group;
    group.name = name;
    group.root = doc.get_string("groups." + name + ".root");
    group.members = doc.get_string_array("groups." + name + ".members");
    seen.insert(name);
    config.groups.push_back(std::move(group));
  }

  // Services may name their group inline instead of listing it under [groups].
  for (const auto &service : config.services) {
    if (service.group.empty()) {
      continue;
    }
    if (!seen.contains(service.group)) {
      config.groups.push_back(GroupConfig{.name = service.group, .root = "", .members = {}});
      seen.insert(service.group);
    }
    for (auto &group : config.groups) {
      if (group.name == service.group &&
          std::find(group.members.begin(), group.members.end(), service.id) ==
              group.members.end()) {
        group.members.push_back(service.id);
      }
    }
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  load_monitor_settings(config.monitor, doc);

  config.recovery.enabled = doc.get_bool("recovery.enabled", config.recovery.enabled);
  if (doc.has("recovery.backoff_secs")) {
    const auto backoff = doc.get_u64_array("recovery.backoff_secs", {});
    if (!backoff.empty() || doc.get_string_array("recovery.backoff_secs").empty()) {
      config.recovery.backoff_secs.assign(backoff.begin(), backoff.end());
    } else {
      return common::Result<Config>::failure("recovery.backoff_secs must be a list of seconds");
    }
  }
  config.recovery.max_restart_attempts =
      get_u32(doc, "recovery.max_restart_attempts", config.recovery.max_restart_attempts);
  config.recovery.command_timeout_secs =
      get_u32(doc, "recovery.command_timeout_secs", config.recovery.command_timeout_secs);
  config.recovery.attempt_history =
      get_u32(doc, "recovery.attempt_history", config.recovery.attempt_history);

  config.governor.max_restarts = get_u32(doc, "governor.max_restarts", config.governor.max_restarts);
  config.governor.window_secs = get_u32(doc, "governor.window_secs", config.governor.window_secs);

  config.alerts.correlation_window_secs =
      get_u32(doc, "alerts.correlation_window_secs", config.alerts.correlation_window_secs);
  config.alerts.webhook_url = expand_config_value(doc.get_string("alerts.webhook_url"));
  config.alerts.webhook_format =
      common::to_lower(doc.get_string("alerts.webhook_format", config.alerts.webhook_format));
  config.alerts.webhook_secret = expand_config_value(doc.get_string("alerts.webhook_secret"));
  config.alerts.webhook_timeout_ms =
      get_u32(doc, "alerts.webhook_timeout_ms", config.alerts.webhook_timeout_ms);
  config.alerts.log_notifications =
      doc.get_bool("alerts.log_notifications", config.alerts.log_notifications);

  config.maintenance.manual_duration_minutes = get_u32(
      doc, "maintenance.manual_duration_minutes", config.maintenance.manual_duration_minutes);

  config.state.path = doc.get_string("state.path", config.state.path);
  config.state.fallback_paths =
      doc.get_string_array("state.fallback_paths", config.state.fallback_paths);
  config.state.status_file = doc.get_string("state.status_file", config.state.status_file);
  config.state.pid_file = doc.get_string("state.pid_file", config.state.pid_file);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  if (auto status = load_services(config, doc); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  load_groups(config, doc);
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *path = std::getenv("SATO_STATE_PATH"); path != nullptr && *path) {
    config.state.path = path;
  }
  if (const char *url = std::getenv("SATO_WEBHOOK_URL"); url != nullptr && *url) {
    config.alerts.webhook_url = url;
  }
  if (const char *secret = std::getenv("SATO_WEBHOOK_SECRET"); secret != nullptr && *secret) {
    config.alerts.webhook_secret = secret;
  }
  if (const char *backend = std::getenv("SATO_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Failure = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.monitor.tick_interval_secs == 0) {
    return Failure::failure("monitor.tick_interval_secs must be > 0");
  }
  if (config.monitor.max_concurrent_checks == 0) {
    return Failure::failure("monitor.max_concurrent_checks must be > 0");
  }
  if (config.monitor.down_after_failures == 0) {
    return Failure::failure("monitor.down_after_failures must be > 0");
  }
  if (config.monitor.degraded_recovery_successes == 0 ||
      config.monitor.down_recovery_successes == 0) {
    return Failure::failure("recovery success thresholds must be > 0");
  }
  if (config.recovery.backoff_secs.empty()) {
    return Failure::failure("recovery.backoff_secs must not be empty");
  }
  if (config.governor.max_restarts == 0 || config.governor.window_secs == 0) {
    return Failure::failure("governor.max_restarts and governor.window_secs must be > 0");
  }
  const std::string format = config.alerts.webhook_format;
  if (format != "generic" && format != "slack" && format != "discord") {
    return Failure::failure("Invalid alerts.webhook_format: " + format);
  }
  if (!config.alerts.webhook_url.empty() &&
      !common::starts_with(config.alerts.webhook_url, "http://") &&
      !common::starts_with(config.alerts.webhook_url, "https://")) {
    return Failure::failure("alerts.webhook_url must be an http(s) URL");
  }
  if (common::trim(config.state.path).empty()) {
    return Failure::failure("state.path must not be empty");
  }

  std::set<std::string> ids;
  for (const auto &service : config.services) {
    if (service.id.empty()) {
      return Failure::failure("service id must not be empty");
    }
    if (!ids.insert(service.id).second) {
      return Failure::failure("duplicate service id: " + service.id);
    }
    if (common::trim(service.target).empty()) {
      return Failure::failure("service '" + service.id + "' has no target");
    }
    if (service.remediation_command.has_value() && service.external) {
      warnings.push_back("service '" + service.id +
                         "' is external; its remediation_command will never run");
    }
    if (service.max_restart_attempts + 1 > config.recovery.backoff_secs.size()) {
      warnings.push_back("service '" + service.id +
                         "' allows more attempts than backoff stages; the last stage repeats");
    }
  }
  for (const auto &service : config.services) {
    for (const auto &dependency : service.depends_on) {
      if (!ids.contains(dependency)) {
        return Failure::failure("service '" + service.id + "' depends on unknown service '" +
                                dependency + "'");
      }
    }
  }
  for (const auto &group : config.groups) {
    if (!group.root.empty() && !ids.contains(group.root)) {
      return Failure::failure("group '" + group.name + "' has unknown root '" + group.root + "'");
    }
    for (const auto &member : group.members) {
      if (!ids.contains(member)) {
        return Failure::failure("group '" + group.name + "' lists unknown member '" + member +
                                "'");
      }
    }
  }
  if (config.services.empty()) {
    warnings.push_back("no services configured");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::vector<std::filesystem::path> state_path_candidates(const Config &config) {
  std::vector<std::filesystem::path> out;
  out.emplace_back(common::expand_path(config.state.path));
  for (const auto &fallback : config.state.fallback_paths) {
    const auto expanded = std::filesystem::path(common::expand_path(fallback));
    if (std::find(out.begin(), out.end(), expanded) == out.end()) {
      out.push_back(expanded);
    }
  }
  return out;
}

} // namespace sato::config
