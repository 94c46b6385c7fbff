#pragma once

#include "sato/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace sato::common {

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] std::int64_t to_unix_millis(TimePoint time_point);
[[nodiscard]] TimePoint from_unix_millis(std::int64_t millis);
[[nodiscard]] std::string format_rfc3339(TimePoint time_point);
[[nodiscard]] std::string now_rfc3339();

/// Parses whole unix seconds as typed on a command line.
[[nodiscard]] Result<TimePoint> parse_unix_seconds(const std::string &value);

} // namespace sato::common
