#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/types.hpp"

namespace pg::engine {

/// Dependency structure of one graph, indexed like ProcessGraph::nodes.
struct EvalPlan {
  std::unordered_map<std::string, int> node_index;
  /// Distinct nodes each node references.
  std::vector<std::vector<int>> dependencies;
  std::vector<std::vector<int>> dependents;
  std::vector<int> pending_counts;
  /// Every node appears after all nodes it references.
  std::vector<int> topo_order;
  int result_index = -1;
};

/// Builds the plan and appends dangling references and cycles to issues.
/// topo_order is only meaningful when no issue was added.
auto build_plan(const ProcessGraph& graph, std::vector<EngineError>& issues) -> EvalPlan;

auto resolve_dependencies(const ProcessGraph& graph) -> Expected<EvalPlan>;

/// Reports every parameter reference that names no declared parameter.
auto collect_parameter_issues(const ProcessGraph& graph, const std::vector<ParameterSpec>& declared,
                              std::vector<EngineError>& issues) -> void;

/// Structural re-check of a plan against its graph right before evaluation.
auto check_plan(const ProcessGraph& graph, const EvalPlan& plan) -> Expected<void>;

}  // namespace pg::engine
