#include "test_framework.hpp"

#include "sato/cli/commands.hpp"
#include "sato/config/config.hpp"
#include "sato/daemon/pid_file.hpp"
#include "sato/state/state_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

namespace st = sato::testing;

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  owned.insert(owned.begin(), "sato");
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return sato::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

/// Config file and state paths inside a throwaway directory, selected
/// through SATO_CONFIG_PATH.
struct CliWorkspace {
  CliWorkspace()
      : config_env("SATO_CONFIG_PATH", (workspace.path() / "config.toml").string()),
        state_env("SATO_STATE_PATH", std::nullopt),
        observability_env("SATO_OBSERVABILITY", std::nullopt) {
    workspace.create_file("config.toml", "[state]\n"
                                         "path = \"" + state_path().string() + "\"\n"
                                         "fallback_paths = []\n"
                                         "pid_file = \"" + pid_path().string() + "\"\n"
                                         "status_file = \"\"\n\n"
                                         "[observability]\n"
                                         "backend = \"none\"\n\n"
                                         "[services.db]\n"
                                         "check_type = \"tcp\"\n"
                                         "target = \"127.0.0.1:1\"\n"
                                         "remediation_command = \"true\"\n");
  }

  [[nodiscard]] std::filesystem::path state_path() const {
    return workspace.path() / "state.db";
  }
  [[nodiscard]] std::filesystem::path pid_path() const { return workspace.path() / "sato.pid"; }

  [[nodiscard]] std::unique_ptr<sato::state::StateStore> open_store() const {
    auto store = sato::state::StateStore::open({state_path()});
    sato::tests::require(store.ok(), store.ok() ? "" : store.error());
    return std::move(store.value());
  }

  void seed_open_group(const std::string &id) const {
    sato::state::StateSnapshot snapshot;
    sato::alerts::AlertGroup group;
    group.id = id;
    group.root = "db";
    group.first_seen = st::test_epoch();
    group.last_seen = st::test_epoch();
    snapshot.open_groups.push_back(group);
    sato::tests::require(open_store()->save(snapshot).ok(), "seed snapshot");
  }

  st::TempWorkspace workspace;
  st::EnvGuard config_env;
  st::EnvGuard state_env;
  st::EnvGuard observability_env;
};

} // namespace

void register_cli_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace ss = sato::state;

  tests.push_back({"cli_rejects_unknown_commands", [] {
                     CliWorkspace cli;
                     require(run_cli({"frobnicate"}) == 1, "unknown command");
                     require(run_cli({"maintenance", "sideways"}) == 1, "unknown maintenance verb");
                     require(run_cli({"maintenance"}) == 1, "missing maintenance verb");
                     require(run_cli({"ack"}) == 1, "missing group id");
                     require(run_cli({"--config"}) == 1, "missing config value");
                   }});

  tests.push_back({"cli_schedule_requires_positive_minutes", [] {
                     CliWorkspace cli;
                     require(run_cli({"maintenance", "schedule", "--services", "db"}) == 1,
                             "missing --minutes");
                     require(run_cli({"maintenance", "schedule", "--minutes", "0"}) == 1,
                             "zero minutes");
                     require(run_cli({"maintenance", "schedule", "--minutes", "ten"}) == 1,
                             "non-numeric minutes");
                     require(run_cli({"maintenance", "schedule", "--minutes", "10", "--start",
                                      "yesterday"}) == 1,
                             "bad start time");
                     auto loaded = cli.open_store()->load();
                     require(loaded.ok() && loaded.value().maintenance.empty(),
                             "nothing scheduled");
                   }});

  tests.push_back({"cli_maintenance_applies_directly_without_daemon", [] {
                     CliWorkspace cli;
                     require(run_cli({"maintenance", "on", "--services", "db"}) == 0,
                             "maintenance on");
                     auto store = cli.open_store();
                     auto loaded = store->load();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().maintenance.size() == 1, "one window stored");
                     const auto &window = loaded.value().maintenance.front();
                     require(window.manual && window.scope.covers("db") && !window.scope.all,
                             "manual window for db");
                     auto queued = store->take_actions();
                     require(queued.ok() && queued.value().empty(), "nothing queued");
                   }});

  tests.push_back({"cli_schedule_applies_directly_without_daemon", [] {
                     CliWorkspace cli;
                     require(run_cli({"maintenance", "schedule", "--services", "db", "--start",
                                      "1704067200", "--minutes", "30"}) == 0,
                             "schedule");
                     auto loaded = cli.open_store()->load();
                     require(loaded.ok(), "load");
                     require(loaded.value().maintenance.size() == 1, "window stored");
                     const auto &window = loaded.value().maintenance.front();
                     require(window.start == st::test_epoch(), "start honored");
                     require(window.duration == std::chrono::minutes(30), "duration honored");
                     require(!window.manual, "scheduled window");
                   }});

  tests.push_back({"cli_ack_applies_directly_with_actor", [] {
                     CliWorkspace cli;
                     cli.seed_open_group("0123456789ab");
                     require(run_cli({"ack", "ffffffffffff", "--actor", "alice"}) == 1,
                             "unknown group rejected");
                     require(run_cli({"ack", "0123456789ab", "--actor", "alice"}) == 0, "ack");
                     auto loaded = cli.open_store()->load();
                     require(loaded.ok(), "load");
                     require(loaded.value().open_groups.size() == 1, "group still open");
                     const auto &group = loaded.value().open_groups.front();
                     require(group.acknowledged, "acknowledged");
                     require(group.ack_actor == "alice", "actor recorded");
                   }});

  tests.push_back({"cli_queues_actions_while_daemon_runs", [] {
                     CliWorkspace cli;
                     cli.seed_open_group("0123456789ab");
                     sato::daemon::PidFile pid(cli.pid_path());
                     require(pid.acquire().ok(), "pid file");

                     require(run_cli({"ack", "0123456789ab", "-a", "bob"}) == 0, "ack queued");
                     require(run_cli({"maintenance", "toggle", "-s", "db"}) == 0,
                             "toggle queued");
                     require(run_cli({"maintenance", "schedule", "--start", "1704067200",
                                      "--minutes", "15"}) == 0,
                             "schedule queued");
                     pid.release();

                     auto store = cli.open_store();
                     auto loaded = store->load();
                     require(loaded.ok(), "load");
                     require(!loaded.value().open_groups.front().acknowledged,
                             "not applied directly");
                     require(loaded.value().maintenance.empty(), "no window applied directly");

                     auto actions = store->take_actions();
                     require(actions.ok(), "take actions");
                     const auto &queued = actions.value();
                     require(queued.size() == 3, "three queued actions");
                     require(queued[0].kind == ss::ActionKind::Acknowledge &&
                                 queued[0].target == "0123456789ab" && queued[0].actor == "bob",
                             "ack queued with actor");
                     require(queued[1].kind == ss::ActionKind::MaintenanceToggle &&
                                 queued[1].target == "db",
                             "toggle queued for db");
                     require(queued[2].kind == ss::ActionKind::Schedule &&
                                 queued[2].target == "*" &&
                                 queued[2].start == st::test_epoch() &&
                                 queued[2].duration == std::chrono::minutes(15),
                             "schedule queued for everything");
                   }});

  tests.push_back({"cli_config_flag_selects_file", [] {
                     CliWorkspace cli;
                     st::EnvGuard unset("SATO_CONFIG_PATH", std::nullopt);
                     const auto path = (cli.workspace.path() / "config.toml").string();
                     const int code = run_cli({"--config", path, "validate"});
                     sato::config::clear_config_path_override();
                     require(code == 0, "validate with --config");
                   }});
}
