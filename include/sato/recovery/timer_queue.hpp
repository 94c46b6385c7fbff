#pragma once

#include "sato/common/time.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sato::recovery {

using TimerId = std::uint64_t;

struct DueTimer {
  TimerId id = 0;
  std::string service_id;
  common::TimePoint due{};
};

/// Cancellable deadlines keyed by id. Whoever polls `pop_due` owns firing.
class TimerQueue {
public:
  TimerId schedule(const std::string &service_id, common::TimePoint due);
  bool cancel(TimerId id);

  /// Removes and returns every timer due at or before `now`, earliest first.
  [[nodiscard]] std::vector<DueTimer> pop_due(common::TimePoint now);
  [[nodiscard]] std::optional<common::TimePoint> next_due() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<DueTimer> pending() const;

private:
  mutable std::mutex mutex_;
  std::map<TimerId, DueTimer> timers_;
  TimerId next_id_ = 1;
};

} // namespace sato::recovery
