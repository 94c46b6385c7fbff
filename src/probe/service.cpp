#include "sato/probe/service.hpp"

#include "sato/common/fs.hpp"

namespace sato::probe {

std::string check_type_to_string(const CheckType type) {
  switch (type) {
  case CheckType::Http:
    return "http";
  case CheckType::Tcp:
    return "tcp";
  case CheckType::Container:
    return "container";
  case CheckType::Unit:
    return "unit";
  case CheckType::Custom:
    return "custom";
  }
  return "custom";
}

common::Result<CheckType> parse_check_type(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "http" || normalized == "https") {
    return common::Result<CheckType>::success(CheckType::Http);
  }
  if (normalized == "tcp" || normalized == "port") {
    return common::Result<CheckType>::success(CheckType::Tcp);
  }
  if (normalized == "container" || normalized == "docker") {
    return common::Result<CheckType>::success(CheckType::Container);
  }
  if (normalized == "unit" || normalized == "systemd") {
    return common::Result<CheckType>::success(CheckType::Unit);
  }
  if (normalized == "custom" || normalized == "command") {
    return common::Result<CheckType>::success(CheckType::Custom);
  }
  return common::Result<CheckType>::failure("unknown check type: " + value);
}

} // namespace sato::probe
