#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"
#include "engine/types.hpp"
#include "runtime/executor.hpp"

namespace pg::engine {

struct EngineConfig {
  /// Worker pool and recursion limit for graph evaluation.
  ExecutorConfig executor;
  /// Threads serving evaluate_async.
  int async_threads = 2;
};

/// Reads --eval_threads, --max_recursion_depth and --async_threads.
auto engine_config_from_flags() -> EngineConfig;

/// Installs built-in processes before the registry is frozen.
using ProcessInstaller = std::function<Expected<void>(ProcessRegistry&)>;

/// High-level facade that owns the process registry, the executor and the
/// async pool. Each evaluation works on a registry snapshot taken when it
/// starts.
class Engine {
 public:
  explicit Engine(EngineConfig config = {});
  ~Engine();

  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;

  /// Builds an engine, runs installer on its registry and freezes the
  /// built-ins.
  static auto create(EngineConfig config, const ProcessInstaller& installer) -> Expected<std::unique_ptr<Engine>>;

  auto registry() -> ProcessRegistry&;
  auto registry() const -> const ProcessRegistry&;

  /// Every structural problem found in document; empty when it can run.
  auto validate(const Json& document, std::string_view owner = {}) const -> std::vector<EngineError>;
  auto validate_text(std::string_view text, std::string_view owner = {}) const -> std::vector<EngineError>;

  /// Evaluates a bare graph or a process object and returns the output of
  /// its result node.
  auto evaluate(const Json& document, const Json& parameters = Json::object(), std::string_view owner = {}) const
    -> Expected<Json>;
  auto evaluate_text(std::string_view text, const Json& parameters = Json::object(),
                     std::string_view owner = {}) const -> Expected<Json>;

  /// Sender completing with the Expected<Json> of evaluate, run on the
  /// async pool.
  auto evaluate_async(Json document, Json parameters = Json::object(), std::string owner = {}) const {
    return stdexec::schedule(async_pool_.get_scheduler())
      | stdexec::then([this, document = std::move(document), parameters = std::move(parameters),
                       owner = std::move(owner)]() { return evaluate(document, parameters, owner); });
  }

  auto put_user_defined(std::string_view owner, const Json& definition)
    -> Expected<std::shared_ptr<const ProcessDefinition>>;
  auto remove_user_defined(std::string_view owner, std::string_view id) -> bool;

  /// openEO description of a process visible to owner.
  auto describe_process(std::string_view owner, std::string_view id) const -> std::optional<Json>;
  /// {"processes": [...]} for every process visible to owner.
  auto list_processes(std::string_view owner = {}) const -> Json;

  auto executor() const -> const Executor& { return executor_; }

 private:
  struct Prepared {
    GraphDocument document;
    EvalPlan plan;
    std::shared_ptr<const RegistrySnapshot> snapshot;
  };

  auto prepare(const Json& document, std::string_view owner, std::vector<EngineError>& issues) const -> Prepared;

  ProcessRegistry registry_;
  Executor executor_;
  // Declared last so in-flight evaluate_async tasks are joined before the
  // executor and registry they use are destroyed.
  mutable exec::static_thread_pool async_pool_;
};

}  // namespace pg::engine
