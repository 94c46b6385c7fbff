#include "sato/net/tcp.hpp"

#include "sato/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sato::net {

namespace {

common::Status connect_one(const addrinfo *info, const std::chrono::milliseconds timeout) {
  const int fd = socket(info->ai_family, info->ai_socktype, info->ai_protocol);
  if (fd < 0) {
    return common::Status::error(std::string("socket: ") + std::strerror(errno));
  }
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  int rc = connect(fd, info->ai_addr, info->ai_addrlen);
  if (rc != 0 && errno != EINPROGRESS) {
    const std::string error = std::strerror(errno);
    close(fd);
    return common::Status::error("connect: " + error);
  }

  if (rc != 0) {
    struct pollfd pfd = {.fd = fd, .events = POLLOUT, .revents = 0};
    rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0) {
      close(fd);
      return common::Status::error("connect timed out");
    }
    if (rc < 0) {
      const std::string error = std::strerror(errno);
      close(fd);
      return common::Status::error("poll: " + error);
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
      close(fd);
      return common::Status::error(std::string("connect: ") +
                                   std::strerror(so_error != 0 ? so_error : errno));
    }
  }

  close(fd);
  return common::Status::success();
}

} // namespace

common::Result<Endpoint> parse_endpoint(const std::string &target) {
  std::string value = common::trim(target);
  for (const char *scheme : {"tcp://", "tcp:"}) {
    if (common::starts_with(value, scheme)) {
      value = value.substr(std::strlen(scheme));
      break;
    }
  }

  Endpoint endpoint;
  std::string port_text;
  if (!value.empty() && value.front() == '[') {
    const auto close_bracket = value.find(']');
    if (close_bracket == std::string::npos || close_bracket + 1 >= value.size() ||
        value[close_bracket + 1] != ':') {
      return common::Result<Endpoint>::failure("invalid tcp target: " + target);
    }
    endpoint.host = value.substr(1, close_bracket - 1);
    port_text = value.substr(close_bracket + 2);
  } else {
    const auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0) {
      return common::Result<Endpoint>::failure("tcp target needs host:port: " + target);
    }
    endpoint.host = value.substr(0, colon);
    port_text = value.substr(colon + 1);
  }

  unsigned int port = 0;
  const auto *first = port_text.data();
  const auto *last = first + port_text.size();
  auto [ptr, ec] = std::from_chars(first, last, port);
  if (ec != std::errc() || ptr != last || port == 0 || port > 65535) {
    return common::Result<Endpoint>::failure("invalid port in tcp target: " + target);
  }
  endpoint.port = static_cast<std::uint16_t>(port);
  return common::Result<Endpoint>::success(std::move(endpoint));
}

common::Status tcp_connect(const Endpoint &endpoint, const std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *results = nullptr;
  const std::string port = std::to_string(endpoint.port);
  const int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    return common::Status::error("resolve " + endpoint.host + ": " + gai_strerror(rc));
  }

  common::Status last = common::Status::error("no addresses for " + endpoint.host);
  for (const addrinfo *info = results; info != nullptr; info = info->ai_next) {
    last = connect_one(info, timeout);
    if (last.ok()) {
      break;
    }
  }
  freeaddrinfo(results);
  return last;
}

} // namespace sato::net
