#include "sato/probe/probe.hpp"

#include "sato/common/fs.hpp"

#include <algorithm>

namespace sato::probe {

namespace {

bool status_accepted(const Service &service, const std::uint16_t status) {
  if (service.expected_status.empty()) {
    return status >= 200 && status < 300;
  }
  return std::find(service.expected_status.begin(), service.expected_status.end(), status) !=
         service.expected_status.end();
}

} // namespace

HttpProbe::HttpProbe(std::shared_ptr<net::HttpClient> client) : client_(std::move(client)) {}

ProbeOutcome HttpProbe::check(const Service &service, const std::chrono::milliseconds timeout) {
  const std::string url = common::trim(service.target);
  if (!common::starts_with(url, "http://") && !common::starts_with(url, "https://")) {
    return ProbeOutcome{.success = false, .error = "invalid http target: " + service.target};
  }

  const auto timeout_ms = static_cast<std::uint64_t>(timeout.count());
  auto response = client_->head(url, {}, timeout_ms);
  // Some servers refuse HEAD outright.
  if (!response.network_error && (response.status == 405 || response.status == 501)) {
    response = client_->get(url, {}, timeout_ms);
  }

  if (response.timeout) {
    return ProbeOutcome{.success = false, .error = "timeout"};
  }
  if (response.network_error) {
    return ProbeOutcome{.success = false, .error = response.network_error_message};
  }
  if (!status_accepted(service, response.status)) {
    return ProbeOutcome{.success = false,
                        .error = "unexpected status " + std::to_string(response.status)};
  }
  return ProbeOutcome{.success = true};
}

} // namespace sato::probe
