#include "engine/plan.hpp"

#include <format>
#include <unordered_set>
#include <utility>

namespace pg::engine {
namespace {

enum class Color : unsigned char {
  White,
  Grey,
  Black,
};

struct PlanBuilder {
  const ProcessGraph& graph;
  std::vector<EngineError>& issues;
  EvalPlan plan;

  auto index_nodes() -> void {
    plan.node_index.reserve(graph.nodes.size());
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
      plan.node_index.emplace(graph.nodes[i].id, static_cast<int>(i));
    }
    plan.result_index = graph.result_index;
  }

  auto link_references() -> void {
    const std::size_t count = graph.nodes.size();
    plan.dependencies.assign(count, {});
    plan.dependents.assign(count, {});
    plan.pending_counts.assign(count, 0);

    for (std::size_t i = 0; i < count; ++i) {
      const auto& node = graph.nodes[i];
      std::vector<std::string> node_refs;
      std::vector<std::string> parameter_refs;
      for (const auto& argument : node.arguments) {
        collect_references(argument.value, node_refs, parameter_refs);
      }

      std::unordered_set<int> seen;
      std::unordered_set<std::string> reported;
      for (const auto& target : node_refs) {
        auto it = plan.node_index.find(target);
        if (it == plan.node_index.end()) {
          if (reported.insert(target).second) {
            auto error = make_error(ErrorKind::DanglingReference,
                                    std::format("node '{}' references unknown node '{}'", node.id, target),
                                    node.id);
            error.nodes.push_back(target);
            issues.push_back(std::move(error));
          }
          continue;
        }
        if (!seen.insert(it->second).second) {
          continue;
        }
        plan.dependencies[i].push_back(it->second);
        if (it->second != static_cast<int>(i)) {
          plan.dependents[static_cast<std::size_t>(it->second)].push_back(static_cast<int>(i));
        }
      }
    }

    for (std::size_t i = 0; i < count; ++i) {
      int pending = 0;
      for (int dependency : plan.dependencies[i]) {
        if (dependency != static_cast<int>(i)) {
          pending += 1;
        }
      }
      plan.pending_counts[i] = pending;
    }
  }

  auto report_cycle(const std::vector<std::pair<int, std::size_t>>& stack, int back_target) -> void {
    std::vector<std::string> members;
    bool inside = false;
    for (const auto& [node, cursor] : stack) {
      inside = inside || node == back_target;
      if (inside) {
        members.push_back(graph.nodes[static_cast<std::size_t>(node)].id);
      }
    }
    std::string path;
    for (const auto& member : members) {
      path += member + " -> ";
    }
    path += graph.nodes[static_cast<std::size_t>(back_target)].id;

    auto error = make_error(ErrorKind::CyclicDependency, std::format("cyclic dependency: {}", path),
                            members.front());
    error.nodes = std::move(members);
    issues.push_back(std::move(error));
  }

  // Iterative so a crafted, very deep chain cannot exhaust the native stack.
  auto order_nodes() -> void {
    const std::size_t count = graph.nodes.size();
    std::vector<Color> colors(count, Color::White);
    plan.topo_order.clear();
    plan.topo_order.reserve(count);

    std::vector<std::pair<int, std::size_t>> stack;
    for (std::size_t root = 0; root < count; ++root) {
      if (colors[root] != Color::White) {
        continue;
      }
      colors[root] = Color::Grey;
      stack.emplace_back(static_cast<int>(root), 0);

      while (!stack.empty()) {
        auto& [node, cursor] = stack.back();
        const auto& edges = plan.dependencies[static_cast<std::size_t>(node)];
        if (cursor >= edges.size()) {
          colors[static_cast<std::size_t>(node)] = Color::Black;
          plan.topo_order.push_back(node);
          stack.pop_back();
          continue;
        }
        int next = edges[cursor];
        cursor += 1;
        switch (colors[static_cast<std::size_t>(next)]) {
          case Color::White:
            colors[static_cast<std::size_t>(next)] = Color::Grey;
            stack.emplace_back(next, 0);
            break;
          case Color::Grey:
            report_cycle(stack, next);
            break;
          case Color::Black:
            break;
        }
      }
    }
  }
};

}  // namespace

auto build_plan(const ProcessGraph& graph, std::vector<EngineError>& issues) -> EvalPlan {
  PlanBuilder builder{graph, issues, {}};
  builder.index_nodes();
  builder.link_references();
  builder.order_nodes();
  return std::move(builder.plan);
}

auto resolve_dependencies(const ProcessGraph& graph) -> Expected<EvalPlan> {
  std::vector<EngineError> issues;
  auto plan = build_plan(graph, issues);
  if (!issues.empty()) {
    auto count = issues.size();
    return tl::unexpected(make_bulk_error(std::format("graph dependencies are invalid ({} issues)", count),
                                          std::move(issues)));
  }
  return plan;
}

auto collect_parameter_issues(const ProcessGraph& graph, const std::vector<ParameterSpec>& declared,
                              std::vector<EngineError>& issues) -> void {
  std::unordered_set<std::string> names;
  for (const auto& spec : declared) {
    names.insert(spec.name);
  }
  for (const auto& node : graph.nodes) {
    std::vector<std::string> node_refs;
    std::vector<std::string> parameter_refs;
    for (const auto& argument : node.arguments) {
      collect_references(argument.value, node_refs, parameter_refs);
    }
    std::unordered_set<std::string> reported;
    for (const auto& name : parameter_refs) {
      if (names.contains(name) || !reported.insert(name).second) {
        continue;
      }
      auto error = make_error(ErrorKind::DanglingReference,
                              std::format("node '{}' references undeclared parameter '{}'", node.id, name),
                              node.id);
      error.parameter = name;
      issues.push_back(std::move(error));
    }
  }
}

auto check_plan(const ProcessGraph& graph, const EvalPlan& plan) -> Expected<void> {
  const std::size_t count = graph.nodes.size();
  if (count == 0) {
    return tl::unexpected(make_error(ErrorKind::AmbiguousOrMissingResult, "graph has no nodes"));
  }
  if (plan.topo_order.size() != count || plan.dependencies.size() != count ||
      plan.dependents.size() != count || plan.pending_counts.size() != count) {
    return tl::unexpected(make_error(ErrorKind::MalformedGraph, "plan does not match its graph"));
  }
  if (plan.result_index < 0 || static_cast<std::size_t>(plan.result_index) >= count ||
      !graph.nodes[static_cast<std::size_t>(plan.result_index)].result) {
    return tl::unexpected(make_error(ErrorKind::AmbiguousOrMissingResult, "plan has no result node"));
  }

  std::vector<int> position(count, -1);
  for (std::size_t i = 0; i < count; ++i) {
    int node = plan.topo_order[i];
    if (node < 0 || static_cast<std::size_t>(node) >= count ||
        position[static_cast<std::size_t>(node)] >= 0) {
      return tl::unexpected(make_error(ErrorKind::MalformedGraph, "plan order is not a permutation"));
    }
    position[static_cast<std::size_t>(node)] = static_cast<int>(i);
  }
  for (std::size_t node = 0; node < count; ++node) {
    if (!graph.nodes[node].well_formed) {
      return tl::unexpected(make_error(ErrorKind::MalformedGraph,
                                       std::format("node '{}' is malformed", graph.nodes[node].id),
                                       graph.nodes[node].id));
    }
    for (int dependency : plan.dependencies[node]) {
      if (position[static_cast<std::size_t>(dependency)] >= position[node]) {
        auto error = make_error(ErrorKind::CyclicDependency,
                                std::format("node '{}' is ordered before its dependency '{}'",
                                            graph.nodes[node].id,
                                            graph.nodes[static_cast<std::size_t>(dependency)].id),
                                graph.nodes[node].id);
        return tl::unexpected(std::move(error));
      }
    }
  }
  return {};
}

}  // namespace pg::engine
