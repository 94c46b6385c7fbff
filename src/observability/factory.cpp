#include "sato/observability/factory.hpp"

#include "sato/common/fs.hpp"
#include "sato/observability/log_observer.hpp"
#include "sato/observability/multi_observer.hpp"
#include "sato/observability/noop_observer.hpp"

#include <iostream>

namespace sato::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend != "log") {
    std::cerr << "[observability] unknown backend '" << backend << "', using log\n";
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    multi->add(create_single(part));
  }
  return multi;
}

} // namespace sato::observability
