#include "sato/state/state_store.hpp"

#include "sato/common/fs.hpp"

#include <iostream>
#include <set>
#include <sstream>

namespace sato::state {

namespace {

constexpr const char *SCHEMA_SQL = R"(
CREATE TABLE IF NOT EXISTS meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS service_status (
  service_id TEXT PRIMARY KEY,
  state TEXT NOT NULL,
  consecutive_failures INTEGER NOT NULL,
  consecutive_successes INTEGER NOT NULL,
  last_transition INTEGER NOT NULL,
  latencies TEXT NOT NULL,
  total_checks INTEGER NOT NULL,
  successful_checks INTEGER NOT NULL,
  total_latency_ms INTEGER NOT NULL,
  down_since INTEGER
);
CREATE TABLE IF NOT EXISTS incidents (
  service_id TEXT PRIMARY KEY,
  opened_at INTEGER NOT NULL,
  phase TEXT NOT NULL,
  attempts INTEGER NOT NULL,
  escalated INTEGER NOT NULL,
  recovered_at INTEGER,
  timer_due INTEGER
);
CREATE TABLE IF NOT EXISTS restart_attempts (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  service_id TEXT NOT NULL,
  attempt_index INTEGER NOT NULL,
  scheduled_at INTEGER NOT NULL,
  executed_at INTEGER,
  outcome TEXT NOT NULL,
  detail TEXT NOT NULL,
  incident_opened_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS failure_windows (
  service_id TEXT PRIMARY KEY,
  stamps TEXT NOT NULL,
  suppressing INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS alert_groups (
  id TEXT PRIMARY KEY,
  root TEXT NOT NULL,
  first_seen INTEGER NOT NULL,
  last_seen INTEGER NOT NULL,
  acknowledged INTEGER NOT NULL,
  ack_actor TEXT NOT NULL,
  ack_at INTEGER,
  escalated INTEGER NOT NULL,
  closed INTEGER NOT NULL,
  closed_at INTEGER
);
CREATE TABLE IF NOT EXISTS alert_members (
  group_id TEXT NOT NULL,
  service_id TEXT NOT NULL,
  PRIMARY KEY (group_id, service_id)
);
CREATE TABLE IF NOT EXISTS maintenance_windows (
  id INTEGER PRIMARY KEY,
  scope TEXT NOT NULL,
  start INTEGER NOT NULL,
  duration_secs INTEGER NOT NULL,
  manual INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS operator_actions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  kind TEXT NOT NULL,
  target TEXT NOT NULL,
  actor TEXT NOT NULL,
  start INTEGER,
  duration_secs INTEGER NOT NULL,
  queued_at INTEGER NOT NULL
);
)";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

/// Finalizes on scope exit; sqlite3_finalize(nullptr) is a no-op.
struct Statement {
  sqlite3_stmt *stmt = nullptr;
  ~Statement() { sqlite3_finalize(stmt); }
};

common::Status prepare(sqlite3 *db, const char *sql, Statement &statement) {
  if (sqlite3_prepare_v2(db, sql, -1, &statement.stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

common::Status step_done(sqlite3 *db, sqlite3_stmt *stmt) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_time(sqlite3_stmt *stmt, const int index, const common::TimePoint value) {
  sqlite3_bind_int64(stmt, index, common::to_unix_millis(value));
}

void bind_optional_time(sqlite3_stmt *stmt, const int index,
                        const std::optional<common::TimePoint> &value) {
  if (value.has_value()) {
    bind_time(stmt, index, *value);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return text == nullptr ? std::string() : std::string(text);
}

common::TimePoint column_time(sqlite3_stmt *stmt, const int index) {
  return common::from_unix_millis(sqlite3_column_int64(stmt, index));
}

std::optional<common::TimePoint> column_optional_time(sqlite3_stmt *stmt, const int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_time(stmt, index);
}

std::string join_numbers(const std::vector<std::int64_t> &values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << values[i];
  }
  return out.str();
}

std::vector<std::int64_t> split_numbers(const std::string &text) {
  std::vector<std::int64_t> out;
  for (const auto &part : common::split(text, ',')) {
    const std::string trimmed = common::trim(part);
    if (trimmed.empty()) {
      continue;
    }
    try {
      out.push_back(std::stoll(trimmed));
    } catch (const std::exception &) {
      // A damaged entry drops only itself.
    }
  }
  return out;
}

bool quick_check(sqlite3 *db) {
  Statement statement;
  if (!prepare(db, "PRAGMA quick_check", statement).ok()) {
    return false;
  }
  if (sqlite3_step(statement.stmt) != SQLITE_ROW) {
    return false;
  }
  return column_text(statement.stmt, 0) == "ok";
}

/// Column sets the loaders and writers rely on. A table missing any of them
/// makes the file unusable even though SQLite opens it.
constexpr const char *REQUIRED_COLUMNS[] = {
    "SELECT key, value FROM meta",
    "SELECT service_id, state, consecutive_failures, consecutive_successes, last_transition, "
    "latencies, total_checks, successful_checks, total_latency_ms, down_since FROM service_status",
    "SELECT service_id, opened_at, phase, attempts, escalated, recovered_at, timer_due "
    "FROM incidents",
    "SELECT seq, service_id, attempt_index, scheduled_at, executed_at, outcome, detail, "
    "incident_opened_at FROM restart_attempts",
    "SELECT service_id, stamps, suppressing FROM failure_windows",
    "SELECT id, root, first_seen, last_seen, acknowledged, ack_actor, ack_at, escalated, closed, "
    "closed_at FROM alert_groups",
    "SELECT group_id, service_id FROM alert_members",
    "SELECT id, scope, start, duration_secs, manual FROM maintenance_windows",
    "SELECT id, kind, target, actor, start, duration_secs, queued_at FROM operator_actions",
};

common::Status verify_columns(sqlite3 *db) {
  for (const char *query : REQUIRED_COLUMNS) {
    Statement statement;
    if (auto status = prepare(db, query, statement); !status.ok()) {
      return common::Status::error("schema mismatch: " + status.error());
    }
  }
  return common::Status::success();
}

void move_aside(const std::filesystem::path &path) {
  std::error_code ec;
  const auto corrupt = std::filesystem::path(path.string() + ".corrupt");
  std::filesystem::remove(corrupt, ec);
  std::filesystem::rename(path, corrupt, ec);
  if (ec) {
    std::filesystem::remove(path, ec);
  }
  for (const char *suffix : {"-wal", "-shm", "-journal"}) {
    std::filesystem::remove(path.string() + suffix, ec);
  }
}

} // namespace

std::string action_kind_to_string(const ActionKind kind) {
  switch (kind) {
  case ActionKind::Acknowledge:
    return "ack";
  case ActionKind::MaintenanceOn:
    return "maintenance_on";
  case ActionKind::MaintenanceOff:
    return "maintenance_off";
  case ActionKind::MaintenanceToggle:
    return "maintenance_toggle";
  case ActionKind::Schedule:
    return "maintenance_schedule";
  }
  return "ack";
}

common::Result<ActionKind> parse_action_kind(const std::string &value) {
  for (const auto kind : {ActionKind::Acknowledge, ActionKind::MaintenanceOn,
                          ActionKind::MaintenanceOff, ActionKind::MaintenanceToggle,
                          ActionKind::Schedule}) {
    if (action_kind_to_string(kind) == value) {
      return common::Result<ActionKind>::success(kind);
    }
  }
  return common::Result<ActionKind>::failure("unknown operator action: " + value);
}

common::Result<sqlite3 *> StateStore::open_database(const std::filesystem::path &path) {
  sqlite3 *db = nullptr;
  if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                      nullptr) != SQLITE_OK) {
    const std::string message = db == nullptr ? "sqlite open failed" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return common::Result<sqlite3 *>::failure(message);
  }
  sqlite3_busy_timeout(db, 2000);
  if (!quick_check(db)) {
    sqlite3_close(db);
    return common::Result<sqlite3 *>::failure("integrity check failed");
  }
  return common::Result<sqlite3 *>::success(db);
}

common::Result<std::unique_ptr<StateStore>>
StateStore::open(const std::vector<std::filesystem::path> &candidates) {
  using StoreResult = common::Result<std::unique_ptr<StateStore>>;
  std::vector<std::string> errors;

  for (const auto &path : candidates) {
    const auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    if (auto writable = common::check_writable_dir(dir); !writable.ok()) {
      errors.push_back(path.string() + ": " + writable.error());
      std::cerr << "[state] warning: " << path.string() << " not writable: " << writable.error()
                << "\n";
      continue;
    }

    auto store = open_at(path, false);
    if (!store.ok()) {
      std::cerr << "[state] warning: " << path.string() << " unusable (" << store.error()
                << "); moved to " << path.string() << ".corrupt and starting empty\n";
      move_aside(path);
      store = open_at(path, true);
    }
    if (!store.ok()) {
      errors.push_back(path.string() + ": " + store.error());
      continue;
    }
    return store;
  }

  std::string message = "no writable state store location";
  if (!errors.empty()) {
    message += " (" + common::join(errors, "; ") + ")";
  }
  return StoreResult::failure(message);
}

common::Result<std::unique_ptr<StateStore>> StateStore::open_at(const std::filesystem::path &path,
                                                                 const bool reinitialized) {
  using StoreResult = common::Result<std::unique_ptr<StateStore>>;
  auto db = open_database(path);
  if (!db.ok()) {
    return StoreResult::failure(db.error());
  }
  std::unique_ptr<StateStore> store(new StateStore(path, db.value(), reinitialized));
  if (auto schema = store->init_schema(); !schema.ok()) {
    return StoreResult::failure(schema.error());
  }
  return StoreResult::success(std::move(store));
}

common::Status StateStore::reinitialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  std::cerr << "[state] warning: discarding unreadable state at " << path_.string() << "\n";
  move_aside(path_);
  auto db = open_database(path_);
  if (!db.ok()) {
    return common::Status::error(db.error());
  }
  db_ = db.value();
  reinitialized_ = true;
  stored_version_ = 0;
  return init_schema();
}

StateStore::StateStore(std::filesystem::path path, sqlite3 *db, const bool reinitialized)
    : path_(std::move(path)), db_(db), reinitialized_(reinitialized) {}

StateStore::~StateStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status StateStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("state db not initialized");
  }
  if (auto status = exec_sql(db_, SCHEMA_SQL); !status.ok()) {
    return status;
  }
  if (auto status = verify_columns(db_); !status.ok()) {
    return status;
  }

  Statement select;
  if (auto status = prepare(db_, "SELECT value FROM meta WHERE key = 'schema_version'", select);
      !status.ok()) {
    return status;
  }
  if (sqlite3_step(select.stmt) == SQLITE_ROW) {
    try {
      stored_version_ = std::stoi(column_text(select.stmt, 0));
    } catch (const std::exception &) {
      stored_version_ = 0;
    }
    if (stored_version_ > SCHEMA_VERSION) {
      std::cerr << "[state] warning: database schema v" << stored_version_
                << " is newer than v" << SCHEMA_VERSION << "; unknown data is ignored\n";
    }
    return common::Status::success();
  }

  stored_version_ = SCHEMA_VERSION;
  return exec_sql(db_, "INSERT INTO meta(key, value) VALUES('schema_version', '" +
                           std::to_string(SCHEMA_VERSION) + "')");
}

common::Result<StateSnapshot> StateStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<StateSnapshot>::failure("state db not initialized");
  }
  StateSnapshot snapshot;
  for (auto loader : {&StateStore::load_statuses, &StateStore::load_incidents,
                      &StateStore::load_attempts, &StateStore::load_failure_windows,
                      &StateStore::load_groups, &StateStore::load_maintenance}) {
    if (auto status = (this->*loader)(snapshot); !status.ok()) {
      return common::Result<StateSnapshot>::failure(status.error());
    }
  }
  return common::Result<StateSnapshot>::success(std::move(snapshot));
}

common::Status StateStore::load_statuses(StateSnapshot &snapshot) {
  Statement statement;
  if (auto status = prepare(db_,
                            "SELECT service_id, state, consecutive_failures, "
                            "consecutive_successes, last_transition, latencies, total_checks, "
                            "successful_checks, total_latency_ms, down_since FROM service_status",
                            statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    const std::string id = column_text(statement.stmt, 0);
    status::StatusRecord record;
    record.state = status::parse_state(column_text(statement.stmt, 1))
                       .value_or(status::ServiceState::Checking);
    record.consecutive_failures =
        static_cast<std::uint32_t>(sqlite3_column_int64(statement.stmt, 2));
    record.consecutive_successes =
        static_cast<std::uint32_t>(sqlite3_column_int64(statement.stmt, 3));
    record.last_transition = column_time(statement.stmt, 4);
    for (const auto latency : split_numbers(column_text(statement.stmt, 5))) {
      record.latencies_ms.push_back(latency);
    }
    record.total_checks = static_cast<std::uint64_t>(sqlite3_column_int64(statement.stmt, 6));
    record.successful_checks = static_cast<std::uint64_t>(sqlite3_column_int64(statement.stmt, 7));
    record.total_latency_ms = static_cast<std::uint64_t>(sqlite3_column_int64(statement.stmt, 8));
    if (const auto down = column_optional_time(statement.stmt, 9); down.has_value()) {
      snapshot.down_since[id] = *down;
    }
    snapshot.statuses[id] = std::move(record);
  }
  return common::Status::success();
}

common::Status StateStore::load_incidents(StateSnapshot &snapshot) {
  Statement statement;
  if (auto status = prepare(db_,
                            "SELECT service_id, opened_at, phase, attempts, escalated, "
                            "recovered_at, timer_due FROM incidents",
                            statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    recovery::Incident incident;
    incident.service_id = column_text(statement.stmt, 0);
    incident.opened_at = column_time(statement.stmt, 1);
    incident.phase = recovery::parse_incident_phase(column_text(statement.stmt, 2))
                         .value_or(recovery::IncidentPhase::Active);
    incident.attempts = static_cast<std::uint32_t>(sqlite3_column_int64(statement.stmt, 3));
    incident.escalated = sqlite3_column_int(statement.stmt, 4) != 0;
    incident.recovered_at = column_optional_time(statement.stmt, 5);
    incident.timer_due = column_optional_time(statement.stmt, 6);
    snapshot.incidents.push_back(std::move(incident));
  }
  return common::Status::success();
}

common::Status StateStore::load_attempts(StateSnapshot &snapshot) {
  Statement statement;
  if (auto status = prepare(db_,
                            "SELECT service_id, attempt_index, scheduled_at, executed_at, outcome, "
                            "detail, incident_opened_at FROM restart_attempts ORDER BY seq",
                            statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    auto outcome = recovery::parse_attempt_outcome(column_text(statement.stmt, 4));
    if (!outcome.ok()) {
      continue;
    }
    snapshot.attempts.push_back(recovery::RestartAttempt{
        .service_id = column_text(statement.stmt, 0),
        .index = static_cast<std::uint32_t>(sqlite3_column_int64(statement.stmt, 1)),
        .scheduled_at = column_time(statement.stmt, 2),
        .executed_at = column_optional_time(statement.stmt, 3),
        .outcome = outcome.value(),
        .detail = column_text(statement.stmt, 5),
        .incident_opened_at = column_time(statement.stmt, 6)});
  }
  return common::Status::success();
}

common::Status StateStore::load_failure_windows(StateSnapshot &snapshot) {
  Statement statement;
  if (auto status =
          prepare(db_, "SELECT service_id, stamps, suppressing FROM failure_windows", statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    FailureWindowSnapshot window;
    window.service_id = column_text(statement.stmt, 0);
    for (const auto millis : split_numbers(column_text(statement.stmt, 1))) {
      window.stamps.push_back(common::from_unix_millis(millis));
    }
    window.suppressing = sqlite3_column_int(statement.stmt, 2) != 0;
    snapshot.failure_windows.push_back(std::move(window));
  }
  return common::Status::success();
}

common::Status StateStore::load_groups(StateSnapshot &snapshot) {
  std::map<std::string, std::set<std::string>> members;
  {
    Statement statement;
    if (auto status =
            prepare(db_, "SELECT group_id, service_id FROM alert_members", statement);
        !status.ok()) {
      return status;
    }
    while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
      members[column_text(statement.stmt, 0)].insert(column_text(statement.stmt, 1));
    }
  }

  Statement statement;
  if (auto status = prepare(db_,
                            "SELECT id, root, first_seen, last_seen, acknowledged, ack_actor, "
                            "ack_at, escalated, closed, closed_at FROM alert_groups "
                            "ORDER BY first_seen, id",
                            statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    alerts::AlertGroup group;
    group.id = column_text(statement.stmt, 0);
    group.root = column_text(statement.stmt, 1);
    group.first_seen = column_time(statement.stmt, 2);
    group.last_seen = column_time(statement.stmt, 3);
    group.acknowledged = sqlite3_column_int(statement.stmt, 4) != 0;
    group.ack_actor = column_text(statement.stmt, 5);
    group.ack_at = column_optional_time(statement.stmt, 6);
    group.escalated = sqlite3_column_int(statement.stmt, 7) != 0;
    group.closed = sqlite3_column_int(statement.stmt, 8) != 0;
    group.closed_at = column_optional_time(statement.stmt, 9);
    if (const auto it = members.find(group.id); it != members.end()) {
      group.members = it->second;
    }
    if (group.closed) {
      snapshot.archived_groups.push_back(std::move(group));
    } else {
      snapshot.open_groups.push_back(std::move(group));
    }
  }
  return common::Status::success();
}

common::Status StateStore::load_maintenance(StateSnapshot &snapshot) {
  Statement statement;
  if (auto status = prepare(db_,
                            "SELECT id, scope, start, duration_secs, manual FROM "
                            "maintenance_windows ORDER BY id",
                            statement);
      !status.ok()) {
    return status;
  }
  while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
    auto scope = maintenance::MaintenanceScope::parse(column_text(statement.stmt, 1));
    if (!scope.ok()) {
      continue;
    }
    snapshot.maintenance.push_back(maintenance::MaintenanceWindow{
        .id = static_cast<std::uint64_t>(sqlite3_column_int64(statement.stmt, 0)),
        .scope = scope.value(),
        .start = column_time(statement.stmt, 2),
        .duration = std::chrono::seconds(sqlite3_column_int64(statement.stmt, 3)),
        .manual = sqlite3_column_int(statement.stmt, 4) != 0});
  }
  return common::Status::success();
}

common::Status StateStore::save(const StateSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("state db not initialized");
  }
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE"); !status.ok()) {
    return status;
  }
  auto status = save_locked(snapshot);
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return status;
  }
  return exec_sql(db_, "COMMIT");
}

common::Status StateStore::save_locked(const StateSnapshot &snapshot) {
  if (auto status = exec_sql(db_, "DELETE FROM service_status; DELETE FROM incidents; "
                                  "DELETE FROM restart_attempts; DELETE FROM failure_windows; "
                                  "DELETE FROM alert_members; DELETE FROM alert_groups; "
                                  "DELETE FROM maintenance_windows;");
      !status.ok()) {
    return status;
  }

  {
    Statement statement;
    if (auto status = prepare(db_,
                              "INSERT INTO service_status(service_id, state, "
                              "consecutive_failures, consecutive_successes, last_transition, "
                              "latencies, total_checks, successful_checks, total_latency_ms, "
                              "down_since) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)",
                              statement);
        !status.ok()) {
      return status;
    }
    for (const auto &[id, record] : snapshot.statuses) {
      sqlite3_reset(statement.stmt);
      bind_text(statement.stmt, 1, id);
      bind_text(statement.stmt, 2, status::state_to_string(record.state));
      sqlite3_bind_int64(statement.stmt, 3, record.consecutive_failures);
      sqlite3_bind_int64(statement.stmt, 4, record.consecutive_successes);
      bind_time(statement.stmt, 5, record.last_transition);
      bind_text(statement.stmt, 6,
                join_numbers(std::vector<std::int64_t>(record.latencies_ms.begin(),
                                                       record.latencies_ms.end())));
      sqlite3_bind_int64(statement.stmt, 7, static_cast<sqlite3_int64>(record.total_checks));
      sqlite3_bind_int64(statement.stmt, 8, static_cast<sqlite3_int64>(record.successful_checks));
      sqlite3_bind_int64(statement.stmt, 9, static_cast<sqlite3_int64>(record.total_latency_ms));
      const auto down = snapshot.down_since.find(id);
      bind_optional_time(statement.stmt, 10,
                         down == snapshot.down_since.end()
                             ? std::nullopt
                             : std::optional<common::TimePoint>(down->second));
      if (auto status = step_done(db_, statement.stmt); !status.ok()) {
        return status;
      }
    }
  }

  {
    Statement statement;
    if (auto status = prepare(db_,
                              "INSERT INTO incidents(service_id, opened_at, phase, attempts, "
                              "escalated, recovered_at, timer_due) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)",
                              statement);
        !status.ok()) {
      return status;
    }
    for (const auto &incident : snapshot.incidents) {
      sqlite3_reset(statement.stmt);
      bind_text(statement.stmt, 1, incident.service_id);
      bind_time(statement.stmt, 2, incident.opened_at);
      bind_text(statement.stmt, 3, recovery::incident_phase_to_string(incident.phase));
      sqlite3_bind_int64(statement.stmt, 4, incident.attempts);
      sqlite3_bind_int(statement.stmt, 5, incident.escalated ? 1 : 0);
      bind_optional_time(statement.stmt, 6, incident.recovered_at);
      bind_optional_time(statement.stmt, 7, incident.timer_due);
      if (auto status = step_done(db_, statement.stmt); !status.ok()) {
        return status;
      }
    }
  }

  {
    Statement statement;
    if (auto status = prepare(db_,
                              "INSERT INTO restart_attempts(service_id, attempt_index, "
                              "scheduled_at, executed_at, outcome, detail, incident_opened_at) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)",
                              statement);
        !status.ok()) {
      return status;
    }
    for (const auto &attempt : snapshot.attempts) {
      sqlite3_reset(statement.stmt);
      bind_text(statement.stmt, 1, attempt.service_id);
      sqlite3_bind_int64(statement.stmt, 2, attempt.index);
      bind_time(statement.stmt, 3, attempt.scheduled_at);
      bind_optional_time(statement.stmt, 4, attempt.executed_at);
      bind_text(statement.stmt, 5, recovery::attempt_outcome_to_string(attempt.outcome));
      bind_text(statement.stmt, 6, attempt.detail);
      bind_time(statement.stmt, 7, attempt.incident_opened_at);
      if (auto status = step_done(db_, statement.stmt); !status.ok()) {
        return status;
      }
    }
  }

  {
    Statement statement;
    if (auto status = prepare(db_,
                              "INSERT INTO failure_windows(service_id, stamps, suppressing) "
                              "VALUES(?1, ?2, ?3)",
                              statement);
        !status.ok()) {
      return status;
    }
    for (const auto &window : snapshot.failure_windows) {
      std::vector<std::int64_t> millis;
      millis.reserve(window.stamps.size());
      for (const auto stamp : window.stamps) {
        millis.push_back(common::to_unix_millis(stamp));
      }
      sqlite3_reset(statement.stmt);
      bind_text(statement.stmt, 1, window.service_id);
      bind_text(statement.stmt, 2, join_numbers(millis));
      sqlite3_bind_int(statement.stmt, 3, window.suppressing ? 1 : 0);
      if (auto status = step_done(db_, statement.stmt); !status.ok()) {
        return status;
      }
    }
  }

  {
    Statement group_stmt;
    if (auto status = prepare(db_,
                              "INSERT INTO alert_groups(id, root, first_seen, last_seen, "
                              "acknowledged, ack_actor, ack_at, escalated, closed, closed_at) "
                              "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)",
                              group_stmt);
        !status.ok()) {
      return status;
    }
    Statement member_stmt;
    if (auto status = prepare(db_,
                              "INSERT OR IGNORE INTO alert_members(group_id, service_id) "
                              "VALUES(?1, ?2)",
                              member_stmt);
        !status.ok()) {
      return status;
    }

    for (const auto *groups : {&snapshot.open_groups, &snapshot.archived_groups}) {
      for (const auto &group : *groups) {
        sqlite3_reset(group_stmt.stmt);
        bind_text(group_stmt.stmt, 1, group.id);
        bind_text(group_stmt.stmt, 2, group.root);
        bind_time(group_stmt.stmt, 3, group.first_seen);
        bind_time(group_stmt.stmt, 4, group.last_seen);
        sqlite3_bind_int(group_stmt.stmt, 5, group.acknowledged ? 1 : 0);
        bind_text(group_stmt.stmt, 6, group.ack_actor);
        bind_optional_time(group_stmt.stmt, 7, group.ack_at);
        sqlite3_bind_int(group_stmt.stmt, 8, group.escalated ? 1 : 0);
        sqlite3_bind_int(group_stmt.stmt, 9, group.closed ? 1 : 0);
        bind_optional_time(group_stmt.stmt, 10, group.closed_at);
        if (auto status = step_done(db_, group_stmt.stmt); !status.ok()) {
          return status;
        }
        for (const auto &member : group.members) {
          sqlite3_reset(member_stmt.stmt);
          bind_text(member_stmt.stmt, 1, group.id);
          bind_text(member_stmt.stmt, 2, member);
          if (auto status = step_done(db_, member_stmt.stmt); !status.ok()) {
            return status;
          }
        }
      }
    }
  }

  Statement statement;
  if (auto status = prepare(db_,
                            "INSERT INTO maintenance_windows(id, scope, start, duration_secs, "
                            "manual) VALUES(?1, ?2, ?3, ?4, ?5)",
                            statement);
      !status.ok()) {
    return status;
  }
  for (const auto &window : snapshot.maintenance) {
    sqlite3_reset(statement.stmt);
    sqlite3_bind_int64(statement.stmt, 1, static_cast<sqlite3_int64>(window.id));
    bind_text(statement.stmt, 2, window.scope.to_string());
    bind_time(statement.stmt, 3, window.start);
    sqlite3_bind_int64(statement.stmt, 4, window.duration.count());
    sqlite3_bind_int(statement.stmt, 5, window.manual ? 1 : 0);
    if (auto status = step_done(db_, statement.stmt); !status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

common::Status StateStore::enqueue_action(const OperatorAction &action) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("state db not initialized");
  }
  Statement statement;
  if (auto status = prepare(db_,
                            "INSERT INTO operator_actions(kind, target, actor, start, "
                            "duration_secs, queued_at) VALUES(?1, ?2, ?3, ?4, ?5, ?6)",
                            statement);
      !status.ok()) {
    return status;
  }
  bind_text(statement.stmt, 1, action_kind_to_string(action.kind));
  bind_text(statement.stmt, 2, action.target);
  bind_text(statement.stmt, 3, action.actor);
  bind_optional_time(statement.stmt, 4, action.start);
  sqlite3_bind_int64(statement.stmt, 5, action.duration.count());
  bind_time(statement.stmt, 6, action.queued_at);
  return step_done(db_, statement.stmt);
}

common::Result<std::vector<OperatorAction>> StateStore::take_actions() {
  using ActionsResult = common::Result<std::vector<OperatorAction>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ActionsResult::failure("state db not initialized");
  }
  if (auto status = exec_sql(db_, "BEGIN IMMEDIATE"); !status.ok()) {
    return ActionsResult::failure(status.error());
  }

  std::vector<OperatorAction> actions;
  {
    Statement statement;
    if (auto status = prepare(db_,
                              "SELECT id, kind, target, actor, start, duration_secs, queued_at "
                              "FROM operator_actions ORDER BY id",
                              statement);
        !status.ok()) {
      (void)exec_sql(db_, "ROLLBACK");
      return ActionsResult::failure(status.error());
    }
    while (sqlite3_step(statement.stmt) == SQLITE_ROW) {
      auto kind = parse_action_kind(column_text(statement.stmt, 1));
      if (!kind.ok()) {
        std::cerr << "[state] warning: dropping queued action: " << kind.error() << "\n";
        continue;
      }
      actions.push_back(OperatorAction{
          .id = sqlite3_column_int64(statement.stmt, 0),
          .kind = kind.value(),
          .target = column_text(statement.stmt, 2),
          .actor = column_text(statement.stmt, 3),
          .start = column_optional_time(statement.stmt, 4),
          .duration = std::chrono::seconds(sqlite3_column_int64(statement.stmt, 5)),
          .queued_at = column_time(statement.stmt, 6)});
    }
  }

  if (auto status = exec_sql(db_, "DELETE FROM operator_actions"); !status.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
    return ActionsResult::failure(status.error());
  }
  if (auto status = exec_sql(db_, "COMMIT"); !status.ok()) {
    return ActionsResult::failure(status.error());
  }
  return ActionsResult::success(std::move(actions));
}

} // namespace sato::state
