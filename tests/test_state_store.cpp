#include "test_framework.hpp"

#include "sato/state/state_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <unistd.h>

namespace {

sato::state::StateSnapshot sample_snapshot() {
  using std::chrono::seconds;
  namespace rc = sato::recovery;
  const auto t0 = sato::testing::test_epoch();

  sato::state::StateSnapshot snapshot;
  sato::status::StatusRecord db;
  db.state = sato::status::ServiceState::Down;
  db.consecutive_failures = 4;
  db.last_transition = t0;
  db.latencies_ms = {12, 15, 40};
  db.total_checks = 10;
  db.successful_checks = 6;
  db.total_latency_ms = 120;
  snapshot.statuses["db"] = db;
  snapshot.statuses["api"] = sato::status::StatusRecord{};
  snapshot.down_since["db"] = t0;

  rc::Incident incident;
  incident.service_id = "db";
  incident.opened_at = t0;
  incident.phase = rc::IncidentPhase::Active;
  incident.attempts = 2;
  incident.timer_due = t0 + seconds(210);
  snapshot.incidents.push_back(incident);

  snapshot.attempts.push_back(rc::RestartAttempt{.service_id = "db",
                                                 .index = 1,
                                                 .scheduled_at = t0 + seconds(30),
                                                 .executed_at = t0 + seconds(31),
                                                 .outcome = rc::AttemptOutcome::Failure,
                                                 .detail = "exit status 1",
                                                 .incident_opened_at = t0});
  snapshot.attempts.push_back(rc::RestartAttempt{.service_id = "db",
                                                 .index = 2,
                                                 .scheduled_at = t0 + seconds(90),
                                                 .executed_at = std::nullopt,
                                                 .outcome = rc::AttemptOutcome::SkippedRateLimited,
                                                 .detail = "5 restarts within 3600s",
                                                 .incident_opened_at = t0});
  snapshot.failure_windows.push_back(sato::state::FailureWindowSnapshot{
      .service_id = "db", .stamps = {t0 + seconds(31), t0 + seconds(91)}, .suppressing = true});

  sato::alerts::AlertGroup open;
  open.id = "0123456789ab";
  open.root = "db";
  open.members = {"api", "web"};
  open.first_seen = t0;
  open.last_seen = t0 + seconds(15);
  open.acknowledged = true;
  open.ack_actor = "alice";
  open.ack_at = t0 + seconds(60);
  snapshot.open_groups.push_back(open);

  sato::alerts::AlertGroup closed;
  closed.id = "ba9876543210";
  closed.root = "cache";
  closed.first_seen = t0 - seconds(3600);
  closed.last_seen = t0 - seconds(3000);
  closed.escalated = true;
  closed.closed = true;
  closed.closed_at = t0 - seconds(2000);
  snapshot.archived_groups.push_back(closed);

  snapshot.maintenance.push_back(
      sato::maintenance::MaintenanceWindow{.id = 3,
                                           .scope = sato::maintenance::MaintenanceScope::of({"db"}),
                                           .start = t0 + seconds(3600),
                                           .duration = seconds(900),
                                           .manual = false});
  return snapshot;
}

} // namespace

void register_state_store_tests(std::vector<sato::tests::TestCase> &tests) {
  using sato::tests::require;
  namespace ss = sato::state;
  namespace st = sato::testing;

  tests.push_back({"state_store_empty_database_loads_empty", [] {
                     st::TempWorkspace workspace;
                     auto store = ss::StateStore::open({workspace.path() / "state.db"});
                     require(store.ok(), store.ok() ? "" : store.error());
                     require(!store.value()->reinitialized(), "fresh store is not reinitialized");
                     require(store.value()->stored_schema_version() == ss::SCHEMA_VERSION,
                             "schema version recorded");
                     auto loaded = store.value()->load();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().statuses.empty(), "no statuses");
                     require(loaded.value().incidents.empty(), "no incidents");
                   }});

  tests.push_back({"state_store_snapshot_survives_reopen", [] {
                     st::TempWorkspace workspace;
                     const auto path = workspace.path() / "state.db";
                     {
                       auto store = ss::StateStore::open({path});
                       require(store.ok(), "open");
                       auto saved = store.value()->save(sample_snapshot());
                       require(saved.ok(), saved.error());
                     }
                     auto store = ss::StateStore::open({path});
                     require(store.ok(), "reopen");
                     auto loaded = store.value()->load();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     const auto &snapshot = loaded.value();
                     const auto t0 = st::test_epoch();

                     require(snapshot.statuses.size() == 2, "status rows");
                     const auto &db = snapshot.statuses.at("db");
                     require(db.state == sato::status::ServiceState::Down, "db state");
                     require(db.consecutive_failures == 4, "failure counter");
                     require(db.latencies_ms == std::deque<std::int64_t>({12, 15, 40}),
                             "latencies");
                     require(db.total_checks == 10 && db.successful_checks == 6, "counters");
                     require(snapshot.down_since.at("db") == t0, "down since");

                     require(snapshot.incidents.size() == 1, "incident row");
                     const auto &incident = snapshot.incidents.front();
                     require(incident.attempts == 2, "attempt counter");
                     require(incident.timer_due == t0 + std::chrono::seconds(210), "timer due");

                     require(snapshot.attempts.size() == 2, "attempt rows");
                     require(snapshot.attempts[0].executed_at.has_value(), "executed time");
                     require(!snapshot.attempts[1].executed_at.has_value(), "skipped attempt");
                     require(snapshot.attempts[1].outcome ==
                                 sato::recovery::AttemptOutcome::SkippedRateLimited,
                             "outcome");

                     require(snapshot.failure_windows.size() == 1, "failure window");
                     require(snapshot.failure_windows[0].stamps.size() == 2, "stamps");
                     require(snapshot.failure_windows[0].suppressing, "suppressing flag");

                     require(snapshot.open_groups.size() == 1, "open group");
                     const auto &group = snapshot.open_groups.front();
                     require(group.members == std::set<std::string>({"api", "web"}), "members");
                     require(group.acknowledged && group.ack_actor == "alice", "ack state");
                     require(snapshot.archived_groups.size() == 1, "archived group");
                     require(snapshot.archived_groups[0].closed_at.has_value(), "closed time");

                     require(snapshot.maintenance.size() == 1, "maintenance row");
                     require(snapshot.maintenance[0].scope.covers("db") &&
                                 !snapshot.maintenance[0].scope.all,
                             "scope kept");
                     require(snapshot.maintenance[0].duration == std::chrono::seconds(900),
                             "duration kept");
                   }});

  tests.push_back({"state_store_save_replaces_previous_snapshot", [] {
                     st::TempWorkspace workspace;
                     auto store = ss::StateStore::open({workspace.path() / "state.db"});
                     require(store.ok(), "open");
                     require(store.value()->save(sample_snapshot()).ok(), "first save");
                     require(store.value()->save(ss::StateSnapshot{}).ok(), "second save");
                     auto loaded = store.value()->load();
                     require(loaded.ok(), "load");
                     require(loaded.value().open_groups.empty(), "old groups gone");
                     require(loaded.value().incidents.empty(), "old incidents gone");
                   }});

  tests.push_back({"state_store_corrupt_file_is_moved_aside", [] {
                     st::TempWorkspace workspace;
                     workspace.create_file("state.db", std::string(4096, 'x'));
                     const auto path = workspace.path() / "state.db";
                     auto store = ss::StateStore::open({path});
                     require(store.ok(), store.ok() ? "" : store.error());
                     require(store.value()->reinitialized(), "reinitialized flag");
                     require(std::filesystem::exists(path.string() + ".corrupt"),
                             "corrupt copy kept");
                     require(store.value()->save(sample_snapshot()).ok(), "usable after reset");
                   }});

  tests.push_back({"state_store_wrong_column_layout_is_moved_aside", [] {
                     st::TempWorkspace workspace;
                     const auto path = workspace.path() / "state.db";
                     st::exec_sqlite(path, "CREATE TABLE service_status(service_id TEXT PRIMARY KEY, "
                                   "state TEXT)");
                     auto store = ss::StateStore::open({path});
                     require(store.ok(), store.ok() ? "" : store.error());
                     require(store.value()->reinitialized(), "reinitialized flag");
                     require(std::filesystem::exists(path.string() + ".corrupt"),
                             "old file kept aside");
                     require(store.value()->save(sample_snapshot()).ok(), "save after reset");
                     auto loaded = store.value()->load();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().statuses.size() == 2, "rows written");
                   }});

  tests.push_back({"state_store_reinitialize_recovers_unreadable_tables", [] {
                     st::TempWorkspace workspace;
                     const auto path = workspace.path() / "state.db";
                     auto store = ss::StateStore::open({path});
                     require(store.ok(), "open");
                     require(store.value()->save(sample_snapshot()).ok(), "first save");
                     st::exec_sqlite(path, "DROP TABLE incidents; CREATE TABLE incidents(service_id TEXT)");
                     require(!store.value()->load().ok(), "damaged table fails to load");

                     auto reset = store.value()->reinitialize();
                     require(reset.ok(), reset.ok() ? "" : reset.error());
                     require(store.value()->reinitialized(), "flag set");
                     require(std::filesystem::exists(path.string() + ".corrupt"),
                             "damaged file kept aside");
                     auto loaded = store.value()->load();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().incidents.empty(), "starts empty");
                     require(store.value()->save(sample_snapshot()).ok(), "save after reset");
                   }});

  tests.push_back({"state_store_falls_back_to_next_candidate", [] {
                     if (::geteuid() == 0) {
                       // Root ignores directory permissions.
                       return;
                     }
                     st::TempWorkspace workspace;
                     const auto locked = workspace.path() / "locked";
                     std::filesystem::create_directories(locked);
                     std::filesystem::permissions(locked, std::filesystem::perms::owner_read |
                                                              std::filesystem::perms::owner_exec);
                     auto store = ss::StateStore::open(
                         {locked / "state.db", workspace.path() / "fallback" / "state.db"});
                     std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
                     require(store.ok(), store.ok() ? "" : store.error());
                     require(store.value()->path() == workspace.path() / "fallback" / "state.db",
                             "fallback path chosen");
                   }});

  tests.push_back({"state_store_fails_without_writable_location", [] {
                     auto store = ss::StateStore::open({"/proc/sato-nowhere/state.db"});
                     require(!store.ok(), "no usable location should fail");
                   }});

  tests.push_back({"state_store_operator_queue_is_fifo", [] {
                     st::TempWorkspace workspace;
                     auto store = ss::StateStore::open({workspace.path() / "state.db"});
                     require(store.ok(), "open");
                     const auto t0 = st::test_epoch();
                     require(store.value()
                                 ->enqueue_action(ss::OperatorAction{
                                     .id = 0,
                                     .kind = ss::ActionKind::Acknowledge,
                                     .target = "0123456789ab",
                                     .actor = "alice",
                                     .start = std::nullopt,
                                     .duration = std::chrono::seconds(0),
                                     .queued_at = t0})
                                 .ok(),
                             "enqueue ack");
                     require(store.value()
                                 ->enqueue_action(ss::OperatorAction{
                                     .id = 0,
                                     .kind = ss::ActionKind::Schedule,
                                     .target = "db,web",
                                     .actor = "",
                                     .start = t0 + std::chrono::hours(1),
                                     .duration = std::chrono::minutes(30),
                                     .queued_at = t0})
                                 .ok(),
                             "enqueue schedule");
                     auto taken = store.value()->take_actions();
                     require(taken.ok(), "take");
                     require(taken.value().size() == 2, "two actions");
                     require(taken.value()[0].kind == ss::ActionKind::Acknowledge, "fifo order");
                     require(taken.value()[1].start == t0 + std::chrono::hours(1), "start kept");
                     require(taken.value()[1].duration == std::chrono::minutes(30),
                             "duration kept");
                     auto again = store.value()->take_actions();
                     require(again.ok() && again.value().empty(), "queue drained");
                   }});
}
