#pragma once

#include <string_view>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"

namespace pg::engine {

/// Per-evaluation store of node outputs plus the parameters bound for this
/// graph invocation. Each output slot is written once by the node that owns
/// it and read by its dependents after completion has been signalled.
class EvaluationContext {
 public:
  EvaluationContext(const ProcessGraph& graph, const EvalPlan& plan, Json parameters,
                    const std::vector<ParameterSpec>* declared = nullptr);

  EvaluationContext(const EvaluationContext&) = delete;
  auto operator=(const EvaluationContext&) -> EvaluationContext& = delete;

  auto graph() const -> const ProcessGraph& { return *graph_; }
  auto plan() const -> const EvalPlan& { return *plan_; }

  auto output(int node_index) const -> const Json*;
  auto output(std::string_view node_id) const -> const Json*;
  auto result() const -> const Json*;

  /// Returns false when the slot already holds a value; it is never replaced.
  auto record(int node_index, Json value) -> bool;

  /// Bound value first, then the declared default; nullptr when neither exists.
  auto parameter(std::string_view name) const -> const Json*;
  auto parameters() const -> const Json& { return parameters_; }

 private:
  const ProcessGraph* graph_;
  const EvalPlan* plan_;
  Json parameters_;
  const std::vector<ParameterSpec>* declared_;
  std::vector<Json> outputs_;
  mutable std::vector<int> recorded_;
};

}  // namespace pg::engine
