#pragma once

#include "sato/common/time.hpp"
#include "sato/graph/dependency_graph.hpp"
#include "sato/status/classifier.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sato::graph {

struct CorrelatorConfig {
  std::chrono::seconds correlation_window{60};
  std::chrono::seconds default_interval{15};
  std::chrono::seconds root_down_interval{5};
  std::chrono::seconds root_fast_window{600};
};

/// Tags dependent transitions with the upstream root that explains them and
/// shortens the probe interval of roots that are down.
class CascadeCorrelator {
public:
  CascadeCorrelator(const DependencyGraph &graph, CorrelatorConfig config);

  /// Sets `caused_by` on Down/Degraded transitions whose ancestor became
  /// impaired (Degraded or Down) within the correlation window, resolving
  /// chains to the topmost root.
  void attribute(std::vector<status::Transition> &batch);

  /// Topmost impaired ancestor explaining the current impairment of
  /// `service_id`, judged at the time it became impaired.
  [[nodiscard]] std::optional<std::string> root_cause(const std::string &service_id) const;

  [[nodiscard]] std::chrono::seconds probe_interval(const std::string &service_id,
                                                    common::TimePoint now) const;

  [[nodiscard]] std::optional<common::TimePoint> down_since(const std::string &service_id) const;
  void restore_down_since(const std::string &service_id, common::TimePoint at);

private:
  [[nodiscard]] std::optional<std::string> topmost_cause(const std::string &service_id,
                                                         common::TimePoint at) const;
  [[nodiscard]] std::optional<std::string> nearest_cause(const std::string &service_id,
                                                         common::TimePoint at) const;

  const DependencyGraph &graph_;
  CorrelatorConfig config_;
  std::map<std::string, common::TimePoint> down_since_;
  /// Time of the latest transition into Degraded or Down, while impaired.
  std::map<std::string, common::TimePoint> impaired_at_;
};

} // namespace sato::graph
