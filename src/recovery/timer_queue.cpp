#include "sato/recovery/timer_queue.hpp"

#include <algorithm>

namespace sato::recovery {

TimerId TimerQueue::schedule(const std::string &service_id, const common::TimePoint due) {
  std::lock_guard<std::mutex> lock(mutex_);
  const TimerId id = next_id_++;
  timers_[id] = DueTimer{.id = id, .service_id = service_id, .due = due};
  return id;
}

bool TimerQueue::cancel(const TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.erase(id) > 0;
}

std::vector<DueTimer> TimerQueue::pop_due(const common::TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DueTimer> due;
  for (auto it = timers_.begin(); it != timers_.end();) {
    if (it->second.due <= now) {
      due.push_back(std::move(it->second));
      it = timers_.erase(it);
    } else {
      ++it;
    }
  }
  std::stable_sort(due.begin(), due.end(),
                   [](const DueTimer &a, const DueTimer &b) { return a.due < b.due; });
  return due;
}

std::optional<common::TimePoint> TimerQueue::next_due() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<common::TimePoint> earliest;
  for (const auto &[id, timer] : timers_) {
    if (!earliest.has_value() || timer.due < *earliest) {
      earliest = timer.due;
    }
  }
  return earliest;
}

std::size_t TimerQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

std::vector<DueTimer> TimerQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DueTimer> out;
  out.reserve(timers_.size());
  for (const auto &[id, timer] : timers_) {
    out.push_back(timer);
  }
  return out;
}

} // namespace sato::recovery
