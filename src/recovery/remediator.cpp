#include "sato/recovery/remediator.hpp"

namespace sato::recovery {

CommandRemediator::CommandRemediator(std::shared_ptr<exec::CommandRunner> runner,
                                     const std::chrono::seconds timeout)
    : runner_(std::move(runner)), timeout_(timeout) {}

common::Status CommandRemediator::execute(const probe::Service &service,
                                          const std::atomic<bool> *cancel) {
  if (!service.remediation_command.has_value()) {
    return common::Status::error("no remediation command configured for " + service.id);
  }
  const auto run = runner_->run(
      exec::shell_argv(*service.remediation_command),
      exec::CommandOptions{
          .timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_),
          .cancel = cancel});
  if (!run.ok()) {
    return run.status();
  }
  if (!run.value().succeeded()) {
    return common::Status::error(exec::describe_failure(run.value()));
  }
  return common::Status::success();
}

} // namespace sato::recovery
