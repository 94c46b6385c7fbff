#include "sato/probe/probe.hpp"

#include "sato/common/fs.hpp"

#include <sstream>

namespace sato::probe {

namespace {

ProbeOutcome run_failure(const common::Result<exec::CommandResult> &run) {
  if (!run.ok()) {
    return ProbeOutcome{.success = false, .error = run.error()};
  }
  if (run.value().timed_out) {
    return ProbeOutcome{.success = false, .error = "timeout"};
  }
  return ProbeOutcome{.success = false, .error = exec::describe_failure(run.value())};
}

} // namespace

ContainerProbe::ContainerProbe(std::shared_ptr<exec::CommandRunner> runner)
    : runner_(std::move(runner)) {}

ProbeOutcome ContainerProbe::check(const Service &service,
                                   const std::chrono::milliseconds timeout) {
  const auto names = common::split(service.target, ',');
  if (names.empty()) {
    return ProbeOutcome{.success = false, .error = "container target is empty"};
  }

  std::vector<std::string> argv = {"docker", "inspect", "--format", "{{.State.Status}}"};
  argv.insert(argv.end(), names.begin(), names.end());
  const auto run = runner_->run(argv, exec::CommandOptions{.timeout = timeout});
  if (!run.ok() || !run.value().succeeded()) {
    return run_failure(run);
  }

  std::istringstream lines(run.value().stdout_text);
  std::string line;
  std::size_t index = 0;
  while (std::getline(lines, line)) {
    line = common::trim(line);
    if (line.empty()) {
      continue;
    }
    if (line != "running") {
      const std::string name = index < names.size() ? names[index] : service.target;
      return ProbeOutcome{.success = false, .error = "container " + name + " is " + line};
    }
    ++index;
  }
  if (index < names.size()) {
    return ProbeOutcome{.success = false, .error = "container state missing from docker output"};
  }
  return ProbeOutcome{.success = true};
}

UnitProbe::UnitProbe(std::shared_ptr<exec::CommandRunner> runner) : runner_(std::move(runner)) {}

ProbeOutcome UnitProbe::check(const Service &service, const std::chrono::milliseconds timeout) {
  const std::string unit = common::trim(service.target);
  if (unit.empty()) {
    return ProbeOutcome{.success = false, .error = "unit target is empty"};
  }
  const auto run =
      runner_->run({"systemctl", "is-active", unit}, exec::CommandOptions{.timeout = timeout});
  if (!run.ok()) {
    return run_failure(run);
  }
  if (run.value().timed_out) {
    return ProbeOutcome{.success = false, .error = "timeout"};
  }
  // is-active exits non-zero for every state but "active"; the text says which.
  const std::string state = common::trim(run.value().stdout_text);
  if (state != "active") {
    return ProbeOutcome{.success = false,
                        .error = "unit " + unit + " is " + (state.empty() ? "unknown" : state)};
  }
  return ProbeOutcome{.success = true};
}

CustomProbe::CustomProbe(std::shared_ptr<exec::CommandRunner> runner)
    : runner_(std::move(runner)) {}

ProbeOutcome CustomProbe::check(const Service &service, const std::chrono::milliseconds timeout) {
  if (common::trim(service.target).empty()) {
    return ProbeOutcome{.success = false, .error = "custom check command is empty"};
  }
  const auto run =
      runner_->run(exec::shell_argv(service.target), exec::CommandOptions{.timeout = timeout});
  if (!run.ok() || !run.value().succeeded()) {
    return run_failure(run);
  }
  return ProbeOutcome{.success = true};
}

void ProbeRegistry::add(const CheckType type, std::shared_ptr<IProbe> probe) {
  if (probe != nullptr) {
    probes_[type] = std::move(probe);
  }
}

IProbe *ProbeRegistry::find(const CheckType type) const {
  const auto it = probes_.find(type);
  return it == probes_.end() ? nullptr : it->second.get();
}

std::shared_ptr<ProbeRegistry>
create_default_registry(std::shared_ptr<net::HttpClient> http,
                        std::shared_ptr<exec::CommandRunner> runner) {
  auto registry = std::make_shared<ProbeRegistry>();
  registry->add(CheckType::Http, std::make_shared<HttpProbe>(std::move(http)));
  registry->add(CheckType::Tcp, std::make_shared<TcpProbe>());
  registry->add(CheckType::Container, std::make_shared<ContainerProbe>(runner));
  registry->add(CheckType::Unit, std::make_shared<UnitProbe>(runner));
  registry->add(CheckType::Custom, std::make_shared<CustomProbe>(runner));
  return registry;
}

} // namespace sato::probe
