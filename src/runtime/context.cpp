#include "runtime/context.hpp"

#include <atomic>
#include <string>
#include <utility>

namespace pg::engine {

EvaluationContext::EvaluationContext(const ProcessGraph& graph, const EvalPlan& plan, Json parameters,
                                     const std::vector<ParameterSpec>* declared)
    : graph_(&graph),
      plan_(&plan),
      parameters_(parameters.is_object() ? std::move(parameters) : Json::object()),
      declared_(declared),
      outputs_(graph.nodes.size()),
      recorded_(graph.nodes.size(), 0) {}

auto EvaluationContext::output(int node_index) const -> const Json* {
  if (node_index < 0 || static_cast<std::size_t>(node_index) >= outputs_.size()) {
    return nullptr;
  }
  auto index = static_cast<std::size_t>(node_index);
  if (std::atomic_ref<int>(recorded_[index]).load(std::memory_order_acquire) == 0) {
    return nullptr;
  }
  return &outputs_[index];
}

auto EvaluationContext::output(std::string_view node_id) const -> const Json* {
  auto it = plan_->node_index.find(std::string(node_id));
  if (it == plan_->node_index.end()) {
    return nullptr;
  }
  return output(it->second);
}

auto EvaluationContext::result() const -> const Json* {
  return output(plan_->result_index);
}

auto EvaluationContext::record(int node_index, Json value) -> bool {
  if (node_index < 0 || static_cast<std::size_t>(node_index) >= outputs_.size()) {
    return false;
  }
  auto index = static_cast<std::size_t>(node_index);
  std::atomic_ref<int> flag(recorded_[index]);
  if (flag.load(std::memory_order_acquire) != 0) {
    return false;
  }
  outputs_[index] = std::move(value);
  flag.store(1, std::memory_order_release);
  return true;
}

auto EvaluationContext::parameter(std::string_view name) const -> const Json* {
  auto it = parameters_.find(std::string(name));
  if (it != parameters_.end()) {
    return &*it;
  }
  if (declared_) {
    for (const auto& spec : *declared_) {
      if (spec.name == name && spec.has_default) {
        return &spec.default_value;
      }
    }
  }
  return nullptr;
}

}  // namespace pg::engine
