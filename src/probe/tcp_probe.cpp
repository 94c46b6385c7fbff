#include "sato/probe/probe.hpp"

#include "sato/net/tcp.hpp"

namespace sato::probe {

ProbeOutcome TcpProbe::check(const Service &service, const std::chrono::milliseconds timeout) {
  const auto endpoint = net::parse_endpoint(service.target);
  if (!endpoint.ok()) {
    return ProbeOutcome{.success = false, .error = endpoint.error()};
  }
  const auto connected = net::tcp_connect(endpoint.value(), timeout);
  if (!connected.ok()) {
    return ProbeOutcome{.success = false, .error = connected.error()};
  }
  return ProbeOutcome{.success = true};
}

} // namespace sato::probe
