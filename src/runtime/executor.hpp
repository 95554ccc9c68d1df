#pragma once

#include <memory>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"
#include "engine/types.hpp"

namespace pg::engine {

struct ExecutorConfig {
  /// 0 selects the hardware concurrency.
  int worker_threads = 0;
  /// Deepest allowed nesting of user-defined process calls.
  int max_recursion_depth = 16;
};

/// Evaluates validated graphs on a fixed worker pool. Nodes become ready when
/// their last dependency completes; independent nodes run concurrently.
class Executor {
 public:
  explicit Executor(ExecutorConfig config = {});
  ~Executor();

  Executor(const Executor&) = delete;
  auto operator=(const Executor&) -> Executor& = delete;

  /// Runs graph with plan and returns the result node's output. parameters
  /// are the bindings visible to from_argument references; declared supplies
  /// defaults for absent ones.
  auto run(const ProcessGraph& graph, const EvalPlan& plan, const RegistrySnapshot& registry,
           const Json& parameters, const std::vector<ParameterSpec>* declared = nullptr) const -> Expected<Json>;

  auto config() const -> const ExecutorConfig& { return config_; }

 private:
  struct Pools;
  struct Dispatcher;

  ExecutorConfig config_;
  std::shared_ptr<Pools> pools_;
  std::shared_ptr<Dispatcher> dispatcher_;
};

}  // namespace pg::engine
