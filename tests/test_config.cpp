#include "test_framework.hpp"

#include "sato/common/toml.hpp"
#include "sato/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>

namespace {

constexpr const char *SAMPLE_CONFIG = R"(
[monitor]
tick_interval_secs = 20
down_after_failures = 3
degraded_latency_ms = 750

[recovery]
backoff_secs = [10, 20, 40]
max_restart_attempts = 2

[governor]
max_restarts = 4
window_secs = 1800

[alerts]
webhook_url = "https://hooks.example.com/sato"
webhook_format = "Slack"

[services.db]
check_type = "tcp"
target = "127.0.0.1:5432"
remediation_command = "systemctl restart postgresql"

[services.api]
target = "http://127.0.0.1:8080/health"
depends_on = ["db"]
expected_status = [200, 204]
timeout_ms = 2500
group = "stack"

[services.edge]
check_type = "http"
target = "https://edge.example.com"
external = true
max_restart_attempts = 7
)";

} // namespace

void register_config_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace cfg = sato::config;
  namespace st = sato::testing;

  tests.push_back({"config_defaults_match_documented_values", [] {
                     const cfg::Config config;
                     require(config.monitor.tick_interval_secs == 15, "tick interval");
                     require(config.monitor.down_after_failures == 2, "failure threshold");
                     require(config.monitor.degraded_latency_ms == 1000, "latency threshold");
                     require(config.recovery.backoff_secs ==
                                 std::vector<std::uint32_t>({30, 60, 120, 300}),
                             "backoff stages");
                     require(config.recovery.max_restart_attempts == 3, "attempt budget");
                     require(config.governor.max_restarts == 5, "governor cap");
                     require(config.governor.window_secs == 3600, "governor window");
                     require(config.alerts.correlation_window_secs == 60, "correlation window");
                   }});

  tests.push_back({"config_parses_sections_and_services", [] {
                     auto parsed = cfg::parse_config(SAMPLE_CONFIG);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.monitor.tick_interval_secs == 20, "tick interval not parsed");
                     require(config.monitor.down_after_failures == 3, "threshold not parsed");
                     require(config.recovery.backoff_secs ==
                                 std::vector<std::uint32_t>({10, 20, 40}),
                             "backoff not parsed");
                     require(config.governor.max_restarts == 4, "governor not parsed");
                     require(config.alerts.webhook_format == "slack", "format should be lowered");
                     require(config.services.size() == 3, "expected three services");

                     const auto &db = config.services[0];
                     require(db.id == "db", "service order should follow the file");
                     require(db.check_type == sato::probe::CheckType::Tcp, "db check type");
                     require(db.remediation_command == "systemctl restart postgresql",
                             "remediation command");
                     require(db.max_restart_attempts == 2, "default attempts from [recovery]");

                     const auto &api = config.services[1];
                     require(api.depends_on == std::vector<std::string>({"db"}), "depends_on");
                     require(api.expected_status == std::vector<std::uint16_t>({200, 204}),
                             "expected status");
                     require(api.timeout.has_value() && api.timeout->count() == 2500, "timeout");
                     require(!api.remediation_command.has_value(), "api has no command");

                     const auto &edge = config.services[2];
                     require(edge.external, "edge should be external");
                     require(edge.max_restart_attempts == 7, "per-service attempts");

                     require(config.groups.size() == 1, "inline group should be collected");
                     require(config.groups[0].name == "stack", "group name");
                     require(config.groups[0].members == std::vector<std::string>({"api"}),
                             "group members");
                   }});

  tests.push_back({"config_rejects_unknown_check_type", [] {
                     auto parsed = cfg::parse_config("[services.x]\ncheck_type = \"ping\"\n"
                                                     "target = \"x\"\n");
                     require(!parsed.ok(), "unknown check type should fail");
                   }});

  tests.push_back({"config_validate_rejects_unknown_dependency", [] {
                     auto config = st::quiet_config();
                     config.services.push_back(st::make_service("api", {"db"}));
                     auto result = cfg::validate_config(config);
                     require(!result.ok(), "unknown dependency should fail");
                     require(result.error().find("db") != std::string::npos,
                             "error should name the dependency");
                   }});

  tests.push_back({"config_validate_rejects_duplicate_ids", [] {
                     auto config = st::quiet_config();
                     config.services.push_back(st::make_service("api"));
                     config.services.push_back(st::make_service("api"));
                     require(!cfg::validate_config(config).ok(), "duplicate ids should fail");
                   }});

  tests.push_back({"config_validate_warns_on_external_remediation", [] {
                     auto config = st::quiet_config();
                     auto edge = st::make_service("edge");
                     edge.external = true;
                     config.services.push_back(edge);
                     auto result = cfg::validate_config(config);
                     require(result.ok(), result.ok() ? "" : result.error());
                     const auto &warnings = result.value();
                     require(std::any_of(warnings.begin(), warnings.end(),
                                         [](const std::string &w) {
                                           return w.find("external") != std::string::npos;
                                         }),
                             "expected external warning");
                   }});

  tests.push_back({"config_validate_rejects_bad_webhook_format", [] {
                     auto config = st::quiet_config();
                     config.alerts.webhook_format = "teams";
                     require(!cfg::validate_config(config).ok(), "format should be rejected");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     const st::EnvGuard state("SATO_STATE_PATH", "/tmp/sato-env/state.db");
                     const st::EnvGuard hook("SATO_WEBHOOK_URL", "https://example.com/hook");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.state.path == "/tmp/sato-env/state.db", "state path override");
                     require(config.alerts.webhook_url == "https://example.com/hook",
                             "webhook override");
                   }});

  tests.push_back({"config_loads_from_override_path", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("config.toml", SAMPLE_CONFIG);
                     cfg::set_config_path_override(workspace.path() / "config.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().services.size() == 3, "services from file");
                   }});

  tests.push_back({"config_state_candidates_skip_duplicates", [] {
                     cfg::Config config;
                     config.state.path = "/tmp/a/state.db";
                     config.state.fallback_paths = {"/tmp/a/state.db", "/tmp/b/state.db"};
                     const auto candidates = cfg::state_path_candidates(config);
                     require(candidates.size() == 2, "duplicate fallback should be dropped");
                     require(candidates[1] == std::filesystem::path("/tmp/b/state.db"),
                             "fallback order");
                   }});

  tests.push_back({"toml_child_tables_follow_file_order", [] {
                     auto doc = sato::common::parse_toml("[services.b]\nx = 1\n[services.a]\n"
                                                         "x = 2\n[groups.g]\nroot = \"b\"\n");
                     require(doc.ok(), "parse failed");
                     const auto ids = doc.value().child_tables("services");
                     require(ids == std::vector<std::string>({"b", "a"}), "child table order");
                   }});
}
