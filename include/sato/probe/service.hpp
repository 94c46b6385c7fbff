#pragma once

#include "sato/common/result.hpp"
#include "sato/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sato::probe {

enum class CheckType { Http, Tcp, Container, Unit, Custom };

[[nodiscard]] std::string check_type_to_string(CheckType type);
[[nodiscard]] common::Result<CheckType> parse_check_type(const std::string &value);

struct Service {
  std::string id;
  CheckType check_type = CheckType::Http;
  std::string target;
  std::optional<std::string> remediation_command;
  std::uint32_t max_restart_attempts = 3;
  std::vector<std::string> depends_on;
  std::optional<std::chrono::milliseconds> timeout;
  /// Accepted HTTP codes; empty means any 2xx.
  std::vector<std::uint16_t> expected_status;
  /// Remote hosts are observed but never remediated from here.
  bool external = false;
  std::string group;
};

struct ProbeResult {
  std::string service_id;
  common::TimePoint timestamp{};
  bool success = false;
  std::chrono::milliseconds latency{0};
  std::string error;
};

} // namespace sato::probe
