#pragma once

#include "sato/config/schema.hpp"
#include "sato/observability/observer.hpp"

#include <memory>

namespace sato::observability {

/// Builds the observer named by `observability.backend`: "log", "none"/"noop",
/// or a comma list of those.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sato::observability
