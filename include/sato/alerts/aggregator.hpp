#pragma once

#include "sato/alerts/alert_group.hpp"
#include "sato/alerts/notifier.hpp"
#include "sato/maintenance/window_manager.hpp"
#include "sato/status/classifier.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sato::alerts {

using StateLookup = std::function<status::ServiceState(const std::string &)>;

/// Folds attributed transitions into alert groups and decides which ones go
/// out through the notifier. Not synchronized; the monitor serializes calls.
class AlertAggregator {
public:
  AlertAggregator(INotifier &notifier, const maintenance::WindowManager &maintenance);

  /// Returns ids of groups opened by this batch.
  std::vector<std::string> process(const std::vector<status::Transition> &batch,
                                   common::TimePoint now);

  /// Services whose alert maintenance swallowed, once their maintenance has
  /// ended and they are still Degraded or Down with no open group. Each is
  /// handed back once.
  std::vector<std::string> release_held(const StateLookup &state, common::TimePoint now);
  void hold(const std::string &service_id) { held_.insert(service_id); }

  /// Recovery gave up on `service_id`; notifies once unless acknowledged.
  void escalate(const std::string &service_id, common::TimePoint now);

  /// First denial of a suppression episode; always notifies.
  void rate_limited(const std::string &service_id, common::TimePoint now);

  [[nodiscard]] common::Status acknowledge(const std::string &group_id, const std::string &actor,
                                           common::TimePoint now);

  /// Closes groups whose root and members are all Operational again.
  std::vector<std::string> close_resolved(const StateLookup &state, common::TimePoint now);

  [[nodiscard]] const std::vector<AlertGroup> &open_groups() const { return open_; }
  [[nodiscard]] const std::vector<AlertGroup> &archived() const { return archive_; }
  [[nodiscard]] const AlertGroup *find(const std::string &group_id) const;
  [[nodiscard]] const AlertGroup *group_for(const std::string &service_id) const;
  [[nodiscard]] std::uint64_t notifications_sent() const { return sent_; }
  [[nodiscard]] std::uint64_t notifications_suppressed() const { return suppressed_; }

  void restore(std::vector<AlertGroup> open, std::vector<AlertGroup> archived);

private:
  AlertGroup &open_group(const std::string &root, common::TimePoint now);
  AlertGroup *mutable_group_for(const std::string &service_id);
  void send(Notification notification);

  INotifier &notifier_;
  const maintenance::WindowManager &maintenance_;
  std::vector<AlertGroup> open_;
  std::vector<AlertGroup> archive_;
  std::set<std::string> held_;
  std::uint64_t sequence_ = 0;
  std::uint64_t sent_ = 0;
  std::uint64_t suppressed_ = 0;
};

} // namespace sato::alerts
