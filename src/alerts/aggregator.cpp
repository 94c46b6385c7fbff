#include "sato/alerts/aggregator.hpp"

#include "sato/observability/global.hpp"

#include <algorithm>
#include <iostream>

namespace sato::alerts {

AlertAggregator::AlertAggregator(INotifier &notifier,
                                 const maintenance::WindowManager &maintenance)
    : notifier_(notifier), maintenance_(maintenance) {}

AlertGroup &AlertAggregator::open_group(const std::string &root, const common::TimePoint now) {
  AlertGroup group;
  group.id = make_group_id(root, now, ++sequence_);
  group.root = root;
  group.first_seen = now;
  group.last_seen = now;
  open_.push_back(std::move(group));
  return open_.back();
}

AlertGroup *AlertAggregator::mutable_group_for(const std::string &service_id) {
  for (auto &group : open_) {
    if (group.covers(service_id)) {
      return &group;
    }
  }
  return nullptr;
}

const AlertGroup *AlertAggregator::group_for(const std::string &service_id) const {
  for (const auto &group : open_) {
    if (group.covers(service_id)) {
      return &group;
    }
  }
  return nullptr;
}

const AlertGroup *AlertAggregator::find(const std::string &group_id) const {
  for (const auto &group : open_) {
    if (group.id == group_id) {
      return &group;
    }
  }
  for (const auto &group : archive_) {
    if (group.id == group_id) {
      return &group;
    }
  }
  return nullptr;
}

std::vector<std::string> AlertAggregator::process(const std::vector<status::Transition> &batch,
                                                  const common::TimePoint now) {
  // Roots first so their groups exist before dependents look for them.
  std::vector<const status::Transition *> ordered;
  ordered.reserve(batch.size());
  for (const auto &transition : batch) {
    if (!transition.caused_by.has_value()) {
      ordered.push_back(&transition);
    }
  }
  for (const auto &transition : batch) {
    if (transition.caused_by.has_value()) {
      ordered.push_back(&transition);
    }
  }

  struct Opened {
    std::string group_id;
    const status::Transition *trigger = nullptr;
  };
  std::vector<Opened> opened;

  for (const auto *transition : ordered) {
    if (transition->to != status::ServiceState::Down &&
        transition->to != status::ServiceState::Degraded) {
      continue;
    }
    const std::string &service = transition->service_id;
    const std::string target_root = transition->caused_by.value_or(service);

    if (maintenance_.active(service, now) || maintenance_.active(target_root, now)) {
      held_.insert(service);
      ++suppressed_;
      observability::record_alert("", target_root, "maintenance", true);
      continue;
    }

    if (auto *group = mutable_group_for(target_root); group != nullptr) {
      if (service != group->root) {
        group->members.insert(service);
      }
      group->last_seen = now;
      continue;
    }
    if (auto *group = mutable_group_for(service); group != nullptr) {
      group->last_seen = now;
      continue;
    }

    auto &group = open_group(target_root, now);
    if (target_root != service) {
      group.members.insert(service);
    }
    opened.push_back(Opened{.group_id = group.id, .trigger = transition});
  }

  // Notify after the whole batch so the payload carries merged members.
  std::vector<std::string> ids;
  for (const auto &entry : opened) {
    const auto *group = find(entry.group_id);
    if (group == nullptr) {
      continue;
    }
    ids.push_back(group->id);
    send(Notification{.kind = NotificationKind::GroupOpened,
                      .group = *group,
                      .service_id = group->root,
                      .old_status = status::state_to_string(entry.trigger->from),
                      .new_status = status::state_to_string(entry.trigger->to),
                      .response_time_ms = 0,
                      .message = group->members.empty()
                                     ? group->root + " is " +
                                           status::state_to_string(entry.trigger->to)
                                     : group->root + " failure affects " +
                                           std::to_string(group->members.size()) +
                                           " dependent service(s)",
                      .at = now});
  }
  return ids;
}

std::vector<std::string> AlertAggregator::release_held(const StateLookup &state,
                                                       const common::TimePoint now) {
  std::vector<std::string> released;
  for (auto it = held_.begin(); it != held_.end();) {
    if (maintenance_.active(*it, now)) {
      ++it;
      continue;
    }
    const auto current = state(*it);
    if ((current == status::ServiceState::Down || current == status::ServiceState::Degraded) &&
        group_for(*it) == nullptr) {
      released.push_back(*it);
    }
    it = held_.erase(it);
  }
  return released;
}

void AlertAggregator::escalate(const std::string &service_id, const common::TimePoint now) {
  AlertGroup *group = mutable_group_for(service_id);
  if (maintenance_.active(service_id, now) ||
      (group != nullptr && maintenance_.active(group->root, now))) {
    ++suppressed_;
    observability::record_alert(group == nullptr ? "" : group->id, service_id,
                                "maintenance", true);
    return;
  }
  if (group == nullptr) {
    group = &open_group(service_id, now);
  }
  group->last_seen = now;
  if (group->escalated) {
    return;
  }
  group->escalated = true;
  if (group->acknowledged) {
    ++suppressed_;
    observability::record_alert(group->id, group->root, "group_escalated", true);
    return;
  }
  send(Notification{.kind = NotificationKind::GroupEscalated,
                    .group = *group,
                    .service_id = service_id,
                    .old_status = "down",
                    .new_status = "escalated",
                    .response_time_ms = 0,
                    .message = "automatic recovery exhausted for " + service_id +
                               "; manual intervention required",
                    .at = now});
}

void AlertAggregator::rate_limited(const std::string &service_id, const common::TimePoint now) {
  if (maintenance_.active(service_id, now)) {
    ++suppressed_;
    observability::record_alert("", service_id, "maintenance", true);
    return;
  }
  AlertGroup group;
  if (const auto *existing = group_for(service_id); existing != nullptr) {
    group = *existing;
  } else {
    group.root = service_id;
    group.first_seen = now;
    group.last_seen = now;
  }
  send(Notification{.kind = NotificationKind::RateLimited,
                    .group = std::move(group),
                    .service_id = service_id,
                    .old_status = "down",
                    .new_status = "down",
                    .response_time_ms = 0,
                    .message = "restart rate limit reached for " + service_id +
                               "; automatic restarts paused",
                    .at = now});
}

common::Status AlertAggregator::acknowledge(const std::string &group_id, const std::string &actor,
                                            const common::TimePoint now) {
  for (auto &group : open_) {
    if (group.id != group_id) {
      continue;
    }
    if (!group.acknowledged) {
      group.acknowledged = true;
      group.ack_actor = actor;
      group.ack_at = now;
    }
    return common::Status::success();
  }
  for (const auto &group : archive_) {
    if (group.id == group_id) {
      return common::Status::error("alert group " + group_id + " is already closed");
    }
  }
  return common::Status::error("unknown alert group: " + group_id);
}

std::vector<std::string> AlertAggregator::close_resolved(const StateLookup &state,
                                                         const common::TimePoint now) {
  std::vector<std::string> closed;
  auto it = open_.begin();
  while (it != open_.end()) {
    bool resolved = state(it->root) == status::ServiceState::Operational;
    for (const auto &member : it->members) {
      resolved = resolved && state(member) == status::ServiceState::Operational;
    }
    if (!resolved) {
      ++it;
      continue;
    }
    it->closed = true;
    it->closed_at = now;
    closed.push_back(it->id);
    std::cerr << "[alerts] group " << it->id << " closed root=" << it->root << "\n";
    archive_.push_back(std::move(*it));
    it = open_.erase(it);
  }
  return closed;
}

void AlertAggregator::restore(std::vector<AlertGroup> open, std::vector<AlertGroup> archived) {
  open_ = std::move(open);
  archive_ = std::move(archived);
  sequence_ = open_.size() + archive_.size();
}

void AlertAggregator::send(Notification notification) {
  ++sent_;
  observability::record_alert(notification.group.id, notification.group.root,
                              notification_kind_to_string(notification.kind), false);
  const auto status = notifier_.notify(notification);
  if (!status.ok()) {
    observability::record_error("notifier", status.error());
  }
}

} // namespace sato::alerts
