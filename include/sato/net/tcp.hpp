#pragma once

#include "sato/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace sato::net {

struct Endpoint {
  std::string host;
  std::uint16_t port = 0;
};

/// Accepts `host:port` and `[v6addr]:port`.
[[nodiscard]] common::Result<Endpoint> parse_endpoint(const std::string &target);

/// Succeeds once a TCP handshake completes within `timeout`.
[[nodiscard]] common::Status tcp_connect(const Endpoint &endpoint,
                                         std::chrono::milliseconds timeout);

} // namespace sato::net
