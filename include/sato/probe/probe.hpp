#pragma once

#include "sato/exec/command_runner.hpp"
#include "sato/net/http_client.hpp"
#include "sato/probe/service.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sato::probe {

struct ProbeOutcome {
  bool success = false;
  std::string error;
  /// Set by probes that know better than wall-clock timing around the call.
  std::optional<std::chrono::milliseconds> latency;
};

class IProbe {
public:
  virtual ~IProbe() = default;

  /// Must return within roughly `timeout`; every fault is a failed outcome.
  [[nodiscard]] virtual ProbeOutcome check(const Service &service,
                                           std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class HttpProbe final : public IProbe {
public:
  explicit HttpProbe(std::shared_ptr<net::HttpClient> client);

  [[nodiscard]] ProbeOutcome check(const Service &service,
                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::string_view name() const override { return "http"; }

private:
  std::shared_ptr<net::HttpClient> client_;
};

class TcpProbe final : public IProbe {
public:
  [[nodiscard]] ProbeOutcome check(const Service &service,
                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::string_view name() const override { return "tcp"; }
};

/// Target is a container name or a comma-separated list; all must be running.
class ContainerProbe final : public IProbe {
public:
  explicit ContainerProbe(std::shared_ptr<exec::CommandRunner> runner);

  [[nodiscard]] ProbeOutcome check(const Service &service,
                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::string_view name() const override { return "container"; }

private:
  std::shared_ptr<exec::CommandRunner> runner_;
};

class UnitProbe final : public IProbe {
public:
  explicit UnitProbe(std::shared_ptr<exec::CommandRunner> runner);

  [[nodiscard]] ProbeOutcome check(const Service &service,
                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::string_view name() const override { return "unit"; }

private:
  std::shared_ptr<exec::CommandRunner> runner_;
};

class CustomProbe final : public IProbe {
public:
  explicit CustomProbe(std::shared_ptr<exec::CommandRunner> runner);

  [[nodiscard]] ProbeOutcome check(const Service &service,
                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::string_view name() const override { return "custom"; }

private:
  std::shared_ptr<exec::CommandRunner> runner_;
};

class ProbeRegistry {
public:
  void add(CheckType type, std::shared_ptr<IProbe> probe);
  [[nodiscard]] IProbe *find(CheckType type) const;

private:
  std::map<CheckType, std::shared_ptr<IProbe>> probes_;
};

[[nodiscard]] std::shared_ptr<ProbeRegistry>
create_default_registry(std::shared_ptr<net::HttpClient> http,
                        std::shared_ptr<exec::CommandRunner> runner);

} // namespace sato::probe
