#pragma once

#include "sato/common/time.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace sato::alerts {

/// One deduplicated alert: a root incident and the dependents attributed to it.
struct AlertGroup {
  std::string id;
  std::string root;
  /// Attributed dependents; never contains the root itself.
  std::set<std::string> members;
  common::TimePoint first_seen{};
  common::TimePoint last_seen{};
  bool acknowledged = false;
  std::string ack_actor;
  std::optional<common::TimePoint> ack_at;
  bool escalated = false;
  bool closed = false;
  std::optional<common::TimePoint> closed_at;

  [[nodiscard]] bool covers(const std::string &service_id) const {
    return root == service_id || members.contains(service_id);
  }
};

enum class NotificationKind { GroupOpened, GroupEscalated, RateLimited };

[[nodiscard]] std::string notification_kind_to_string(NotificationKind kind);

struct Notification {
  NotificationKind kind = NotificationKind::GroupOpened;
  AlertGroup group;
  /// Service whose event produced the notification (the root for openings).
  std::string service_id;
  std::string old_status;
  std::string new_status;
  std::int64_t response_time_ms = 0;
  std::string message;
  common::TimePoint at{};
};

/// First 12 hex characters of SHA-256 over root, first-seen time and a
/// per-process sequence number.
[[nodiscard]] std::string make_group_id(const std::string &root, common::TimePoint first_seen,
                                        std::uint64_t sequence);

} // namespace sato::alerts
