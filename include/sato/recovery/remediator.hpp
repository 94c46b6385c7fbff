#pragma once

#include "sato/common/result.hpp"
#include "sato/exec/command_runner.hpp"
#include "sato/probe/service.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace sato::recovery {

/// Issues a service's remediation command. The status reports the command
/// invocation, not whether the service came back.
class IRemediator {
public:
  virtual ~IRemediator() = default;

  [[nodiscard]] virtual common::Status execute(const probe::Service &service,
                                               const std::atomic<bool> *cancel) = 0;
};

class CommandRemediator final : public IRemediator {
public:
  CommandRemediator(std::shared_ptr<exec::CommandRunner> runner, std::chrono::seconds timeout);

  [[nodiscard]] common::Status execute(const probe::Service &service,
                                       const std::atomic<bool> *cancel) override;

private:
  std::shared_ptr<exec::CommandRunner> runner_;
  std::chrono::seconds timeout_;
};

} // namespace sato::recovery
