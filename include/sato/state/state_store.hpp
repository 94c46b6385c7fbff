#pragma once

#include "sato/alerts/alert_group.hpp"
#include "sato/common/result.hpp"
#include "sato/maintenance/window_manager.hpp"
#include "sato/recovery/controller.hpp"
#include "sato/status/classifier.hpp"

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sato::state {

constexpr int SCHEMA_VERSION = 1;

struct FailureWindowSnapshot {
  std::string service_id;
  std::vector<common::TimePoint> stamps;
  bool suppressing = false;
};

/// Everything the monitor needs to resume where it stopped.
struct StateSnapshot {
  std::map<std::string, status::StatusRecord> statuses;
  std::map<std::string, common::TimePoint> down_since;
  std::vector<recovery::Incident> incidents;
  std::vector<recovery::RestartAttempt> attempts;
  std::vector<FailureWindowSnapshot> failure_windows;
  std::vector<alerts::AlertGroup> open_groups;
  std::vector<alerts::AlertGroup> archived_groups;
  std::vector<maintenance::MaintenanceWindow> maintenance;
};

enum class ActionKind { Acknowledge, MaintenanceOn, MaintenanceOff, MaintenanceToggle, Schedule };

[[nodiscard]] std::string action_kind_to_string(ActionKind kind);
[[nodiscard]] common::Result<ActionKind> parse_action_kind(const std::string &value);

/// Operator request written by the CLI and applied by the running daemon.
struct OperatorAction {
  std::int64_t id = 0;
  ActionKind kind = ActionKind::Acknowledge;
  /// Group id for acknowledgments, scope text for maintenance.
  std::string target;
  std::string actor;
  std::optional<common::TimePoint> start;
  std::chrono::seconds duration{0};
  common::TimePoint queued_at{};
};

/// SQLite-backed snapshot store. All access goes through one mutex.
class StateStore {
public:
  /// Tries each candidate in order. A corrupt database is moved aside to
  /// `<path>.corrupt` and recreated; failing every candidate is fatal.
  [[nodiscard]] static common::Result<std::unique_ptr<StateStore>>
  open(const std::vector<std::filesystem::path> &candidates);

  ~StateStore();
  StateStore(const StateStore &) = delete;
  StateStore &operator=(const StateStore &) = delete;

  [[nodiscard]] common::Result<StateSnapshot> load();
  /// Replaces the stored snapshot atomically.
  [[nodiscard]] common::Status save(const StateSnapshot &snapshot);

  /// Moves the current file aside and starts over empty. Used when a stored
  /// snapshot turns out to be unreadable after open.
  [[nodiscard]] common::Status reinitialize();

  [[nodiscard]] common::Status enqueue_action(const OperatorAction &action);
  /// Returns and deletes every queued action, oldest first.
  [[nodiscard]] common::Result<std::vector<OperatorAction>> take_actions();

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  /// True when this store discarded an unreadable database.
  [[nodiscard]] bool reinitialized() const { return reinitialized_; }
  [[nodiscard]] int stored_schema_version() const { return stored_version_; }

private:
  StateStore(std::filesystem::path path, sqlite3 *db, bool reinitialized);

  [[nodiscard]] static common::Result<std::unique_ptr<StateStore>>
  open_at(const std::filesystem::path &path, bool reinitialized);
  [[nodiscard]] static common::Result<sqlite3 *> open_database(const std::filesystem::path &path);
  [[nodiscard]] common::Status init_schema();

  [[nodiscard]] common::Status load_statuses(StateSnapshot &snapshot);
  [[nodiscard]] common::Status load_incidents(StateSnapshot &snapshot);
  [[nodiscard]] common::Status load_attempts(StateSnapshot &snapshot);
  [[nodiscard]] common::Status load_failure_windows(StateSnapshot &snapshot);
  [[nodiscard]] common::Status load_groups(StateSnapshot &snapshot);
  [[nodiscard]] common::Status load_maintenance(StateSnapshot &snapshot);

  [[nodiscard]] common::Status save_locked(const StateSnapshot &snapshot);

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  bool reinitialized_ = false;
  int stored_version_ = 0;
  std::mutex mutex_;
};

} // namespace sato::state
