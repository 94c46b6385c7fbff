#include "sato/common/time.hpp"

#include "sato/common/fs.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sato::common {

std::int64_t to_unix_millis(const TimePoint time_point) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch())
      .count();
}

TimePoint from_unix_millis(const std::int64_t millis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(millis)));
}

std::string format_rfc3339(const TimePoint time_point) {
  const auto t = std::chrono::system_clock::to_time_t(time_point);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

Result<TimePoint> parse_unix_seconds(const std::string &value) {
  const std::string normalized = trim(value);
  long long seconds = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, seconds);
  if (ec != std::errc() || ptr != last || first == last) {
    return Result<TimePoint>::failure("invalid unix time: " + value);
  }
  return Result<TimePoint>::success(TimePoint(std::chrono::seconds(seconds)));
}

} // namespace sato::common
