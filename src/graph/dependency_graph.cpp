#include "sato/graph/dependency_graph.hpp"

#include "sato/common/fs.hpp"

#include <algorithm>
#include <iostream>

namespace sato::graph {

namespace {

const std::vector<std::string> &empty_list() {
  static const std::vector<std::string> empty;
  return empty;
}

} // namespace

void DependencyGraph::add_node(const std::string &id) { nodes_.insert(id); }

common::Status DependencyGraph::add_edge(const std::string &root, const std::string &dependent) {
  if (root == dependent) {
    return common::Status::error("self dependency on " + root);
  }
  const auto &existing = dependents(root);
  if (std::find(existing.begin(), existing.end(), dependent) != existing.end()) {
    return common::Status::error("duplicate edge " + root + " -> " + dependent);
  }
  if (reachable(dependent, root)) {
    return common::Status::error("edge " + root + " -> " + dependent + " would close a cycle");
  }

  nodes_.insert(root);
  nodes_.insert(dependent);
  dependents_[root].push_back(dependent);
  parents_[dependent].push_back(root);
  ++edge_count_;
  return common::Status::success();
}

const std::vector<std::string> &DependencyGraph::dependents(const std::string &id) const {
  const auto it = dependents_.find(id);
  return it == dependents_.end() ? empty_list() : it->second;
}

const std::vector<std::string> &DependencyGraph::parents(const std::string &id) const {
  const auto it = parents_.find(id);
  return it == parents_.end() ? empty_list() : it->second;
}

bool DependencyGraph::has_dependents(const std::string &id) const {
  return !dependents(id).empty();
}

bool DependencyGraph::reachable(const std::string &root, const std::string &target) const {
  if (root == target) {
    return true;
  }
  std::vector<std::string> stack = {root};
  std::set<std::string> visited;
  while (!stack.empty()) {
    const std::string current = stack.back();
    stack.pop_back();
    if (!visited.insert(current).second) {
      continue;
    }
    for (const auto &next : dependents(current)) {
      if (next == target) {
        return true;
      }
      stack.push_back(next);
    }
  }
  return false;
}

std::vector<std::pair<std::string, std::string>> DependencyGraph::edges() const {
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(edge_count_);
  for (const auto &[root, list] : dependents_) {
    for (const auto &dependent : list) {
      out.emplace_back(root, dependent);
    }
  }
  return out;
}

std::string synthetic_root_id(const std::string &group_name) { return "group:" + group_name; }

GraphBuild build_graph(const std::vector<probe::Service> &services,
                       const std::vector<config::GroupConfig> &groups) {
  GraphBuild build;
  build.services = services;

  const auto refuse = [&build](const common::Status &status) {
    build.warnings.push_back("ignored dependency: " + status.error());
    std::cerr << "[graph] warning: ignored dependency: " << status.error() << "\n";
  };

  for (const auto &service : services) {
    build.graph.add_node(service.id);
  }
  for (const auto &service : services) {
    for (const auto &dependency : service.depends_on) {
      if (auto status = build.graph.add_edge(dependency, service.id); !status.ok()) {
        refuse(status);
      }
    }
  }

  for (const auto &group : groups) {
    if (group.members.empty()) {
      continue;
    }

    std::string root = group.root;
    if (root.empty()) {
      root = synthetic_root_id(group.name);
      std::vector<std::string> containers;
      for (const auto &member : group.members) {
        const auto it = std::find_if(services.begin(), services.end(),
                                     [&member](const probe::Service &s) { return s.id == member; });
        if (it != services.end() && it->check_type == probe::CheckType::Container) {
          containers.push_back(common::trim(it->target));
        }
      }
      if (containers.empty()) {
        build.warnings.push_back("group '" + group.name +
                                 "' has no root and no container members; left ungrouped");
        continue;
      }
      probe::Service aggregate;
      aggregate.id = root;
      aggregate.check_type = probe::CheckType::Container;
      aggregate.target = common::join(containers, ",");
      aggregate.max_restart_attempts = 0;
      aggregate.group = group.name;
      build.services.push_back(std::move(aggregate));
      build.graph.add_node(root);
    }

    for (const auto &member : group.members) {
      if (member == root) {
        continue;
      }
      if (auto status = build.graph.add_edge(root, member); !status.ok()) {
        // Re-declaring a depends_on edge through a group is not worth a warning.
        if (common::starts_with(status.error(), "duplicate edge")) {
          continue;
        }
        refuse(status);
      }
    }
  }
  return build;
}

} // namespace sato::graph
