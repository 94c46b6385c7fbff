#pragma once

#include "sato/common/time.hpp"

namespace sato::common {

/// Source of wall-clock time for every component that timestamps or
/// schedules. Tests substitute a manually advanced clock.
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace sato::common
