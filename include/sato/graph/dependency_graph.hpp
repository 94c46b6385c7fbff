#pragma once

#include "sato/common/result.hpp"
#include "sato/config/schema.hpp"
#include "sato/probe/service.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sato::graph {

/// Directed root -> dependent edges. Acyclic by construction: an edge that
/// would close a cycle is refused.
class DependencyGraph {
public:
  void add_node(const std::string &id);

  /// Rejects self edges, duplicates and back-edges; the error names the reason.
  [[nodiscard]] common::Status add_edge(const std::string &root, const std::string &dependent);

  [[nodiscard]] bool contains(const std::string &id) const { return nodes_.contains(id); }
  [[nodiscard]] const std::vector<std::string> &dependents(const std::string &id) const;
  [[nodiscard]] const std::vector<std::string> &parents(const std::string &id) const;
  [[nodiscard]] bool has_dependents(const std::string &id) const;

  /// True when `target` is downstream of `root` (following root -> dependent).
  [[nodiscard]] bool reachable(const std::string &root, const std::string &target) const;

  [[nodiscard]] std::vector<std::pair<std::string, std::string>> edges() const;
  [[nodiscard]] std::size_t edge_count() const { return edge_count_; }

private:
  std::set<std::string> nodes_;
  std::map<std::string, std::vector<std::string>> dependents_;
  std::map<std::string, std::vector<std::string>> parents_;
  std::size_t edge_count_ = 0;
};

struct GraphBuild {
  DependencyGraph graph;
  /// Input services plus synthetic roots for groups that name none.
  std::vector<probe::Service> services;
  std::vector<std::string> warnings;
};

[[nodiscard]] std::string synthetic_root_id(const std::string &group_name);

/// Declared depends_on edges go in first, then grouping edges. Refused edges
/// become warnings.
[[nodiscard]] GraphBuild build_graph(const std::vector<probe::Service> &services,
                                     const std::vector<config::GroupConfig> &groups);

} // namespace sato::graph
