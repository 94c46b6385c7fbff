#include "sato/alerts/alert_group.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace sato::alerts {

std::string notification_kind_to_string(const NotificationKind kind) {
  switch (kind) {
  case NotificationKind::GroupOpened:
    return "group_opened";
  case NotificationKind::GroupEscalated:
    return "group_escalated";
  case NotificationKind::RateLimited:
    return "rate_limited";
  }
  return "group_opened";
}

std::string make_group_id(const std::string &root, const common::TimePoint first_seen,
                          const std::uint64_t sequence) {
  const std::string text =
      root + "|" + std::to_string(common::to_unix_millis(first_seen)) + "|" +
      std::to_string(sequence);
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (int i = 0; i < 6; ++i) {
    out << std::setw(2) << static_cast<int>(digest[i]);
  }
  return out.str();
}

} // namespace sato::alerts
