#include "runtime/executor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"
#include "engine/schema.hpp"
#include "runtime/arguments.hpp"
#include "runtime/context.hpp"

namespace pg::engine {
namespace {

auto resolve_processes(const ProcessGraph& graph, const RegistrySnapshot& registry, std::string_view context)
  -> Expected<std::vector<const ProcessDefinition*>> {
  std::vector<const ProcessDefinition*> processes(graph.nodes.size(), nullptr);
  std::vector<EngineError> issues;
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    const auto& node = graph.nodes[i];
    processes[i] = registry.find(node.process_id);
    if (!processes[i]) {
      issues.push_back(make_error(ErrorKind::UnknownProcess,
                                  std::format("node '{}' uses unknown process '{}'", node.id, node.process_id),
                                  node.id));
    }
  }
  if (!issues.empty()) {
    return tl::unexpected(make_bulk_error(std::format("{}: unknown processes", context), std::move(issues)));
  }
  return processes;
}

/// Calls processes with bound arguments. User-defined processes run as an
/// explicit stack of frames on the calling thread, one frame per nesting
/// level, so the recursion limit holds regardless of the native stack.
class ProcessInvoker {
 public:
  ProcessInvoker(const RegistrySnapshot& registry, int max_depth) : registry_(&registry), max_depth_(max_depth) {}

  /// depth is the nesting level of the graph the call is made from.
  auto call(const ProcessDefinition& definition, const Json& arguments, int depth) const -> Expected<Json> {
    auto bound = bind_parameters(definition.parameters, arguments, definition.id);
    if (!bound) {
      return tl::unexpected(bound.error());
    }
    if (definition.kind() == ProcessKind::Builtin) {
      return invoke_builtin(definition, *bound);
    }
    return run_frames(definition, std::move(*bound), depth + 1);
  }

 private:
  struct Frame {
    const ProcessDefinition* definition = nullptr;
    const UserDefinedProcess* body = nullptr;
    std::unique_ptr<EvaluationContext> context;
    std::vector<const ProcessDefinition*> processes;
    std::size_t cursor = 0;
    int depth = 0;

    auto current_node() const -> const NodeDef* {
      if (cursor >= body->plan.topo_order.size()) {
        return nullptr;
      }
      return &body->graph.nodes[static_cast<std::size_t>(body->plan.topo_order[cursor])];
    }
  };

  auto invoke_builtin(const ProcessDefinition& definition, const Json& arguments) const -> Expected<Json> {
    const auto& builtin = std::get<BuiltinProcess>(definition.body);
    Expected<Json> value;
    try {
      value = builtin.invoke(arguments);
    } catch (const std::exception& ex) {
      return tl::unexpected(make_error(ErrorKind::ProcessExecutionFailure,
                                       std::format("process '{}' failed: {}", definition.id, ex.what())));
    } catch (...) {
      return tl::unexpected(make_error(ErrorKind::ProcessExecutionFailure,
                                       std::format("process '{}' failed: unknown exception", definition.id)));
    }
    if (!value) {
      return value;
    }
    if (auto returned = check_return_value(definition.returns, *value, definition.id); !returned) {
      return tl::unexpected(returned.error());
    }
    return value;
  }

  auto push_frame(std::vector<Frame>& stack, const ProcessDefinition& definition, Json parameters, int depth) const
    -> Expected<void> {
    if (depth > max_depth_) {
      return tl::unexpected(make_error(
        ErrorKind::RecursionLimitExceeded,
        std::format("calling '{}' exceeds the recursion limit of {}", definition.id, max_depth_)));
    }
    const auto& body = std::get<UserDefinedProcess>(definition.body);
    if (auto checked = check_plan(body.graph, body.plan); !checked) {
      return tl::unexpected(checked.error());
    }
    auto processes = resolve_processes(body.graph, *registry_, std::format("process '{}'", definition.id));
    if (!processes) {
      return tl::unexpected(processes.error());
    }

    Frame frame;
    frame.definition = &definition;
    frame.body = &body;
    frame.context = std::make_unique<EvaluationContext>(body.graph, body.plan, std::move(parameters),
                                                        &definition.parameters);
    frame.processes = std::move(*processes);
    frame.depth = depth;
    stack.push_back(std::move(frame));
    pg::log::trace("entered '{}' at depth {}", definition.id, depth);
    return {};
  }

  auto fail(const std::vector<Frame>& stack, EngineError error) const -> Expected<Json> {
    if (error.call_path.empty()) {
      for (const auto& frame : stack) {
        const auto* node = frame.current_node();
        error.call_path.push_back(std::format("{}@{}", node ? node->id : std::string("<result>"),
                                              frame.definition->id));
      }
    }
    if (error.node_id.empty() && !stack.empty()) {
      if (const auto* node = stack.back().current_node()) {
        error.node_id = node->id;
      }
    }
    return tl::unexpected(std::move(error));
  }

  auto run_frames(const ProcessDefinition& definition, Json parameters, int depth) const -> Expected<Json> {
    std::vector<Frame> stack;
    stack.reserve(static_cast<std::size_t>(max_depth_ > 0 ? max_depth_ : 1));
    if (auto pushed = push_frame(stack, definition, std::move(parameters), depth); !pushed) {
      return fail(stack, pushed.error());
    }

    while (!stack.empty()) {
      auto& frame = stack.back();
      const auto& order = frame.body->plan.topo_order;

      if (frame.cursor == order.size()) {
        const auto* result = frame.context->result();
        if (!result) {
          return fail(stack, make_error(ErrorKind::MalformedGraph,
                                        std::format("process '{}' produced no result", frame.definition->id)));
        }
        Json value = *result;
        if (auto returned = check_return_value(frame.definition->returns, value, frame.definition->id);
            !returned) {
          return fail(stack, returned.error());
        }
        stack.pop_back();
        if (stack.empty()) {
          return value;
        }
        auto& parent = stack.back();
        if (!parent.context->record(parent.body->plan.topo_order[parent.cursor], std::move(value))) {
          return fail(stack, make_error(ErrorKind::ProcessExecutionFailure,
                                        std::format("output of node '{}' recorded twice", parent.current_node()->id)));
        }
        parent.cursor += 1;
        continue;
      }

      int index = order[frame.cursor];
      const auto& node = frame.body->graph.nodes[static_cast<std::size_t>(index)];
      auto arguments = resolve_arguments(node, *frame.context);
      if (!arguments) {
        return fail(stack, arguments.error());
      }
      const auto* callee = frame.processes[static_cast<std::size_t>(index)];
      auto bound = bind_parameters(callee->parameters, *arguments, callee->id);
      if (!bound) {
        return fail(stack, bound.error());
      }

      if (callee->kind() == ProcessKind::Builtin) {
        auto value = invoke_builtin(*callee, *bound);
        if (!value) {
          return fail(stack, value.error());
        }
        if (!frame.context->record(index, std::move(*value))) {
          return fail(stack, make_error(ErrorKind::ProcessExecutionFailure,
                                        std::format("output of node '{}' recorded twice", node.id)));
        }
        frame.cursor += 1;
      } else if (auto pushed = push_frame(stack, *callee, std::move(*bound), frame.depth + 1); !pushed) {
        return fail(stack, pushed.error());
      }
    }
    return tl::unexpected(make_error(ErrorKind::MalformedGraph,
                                     std::format("process '{}' produced no result", definition.id)));
  }

  const RegistrySnapshot* registry_;
  int max_depth_;
};

struct Dispatcher;

enum NodeState : int {
  Pending = 0,
  Scheduled = 1,
  Done = 2,
  Failed = 3,
  Skipped = 4,
};

struct ExecutionState {
  const ProcessGraph* graph = nullptr;
  const EvalPlan* plan = nullptr;
  Dispatcher* dispatcher = nullptr;
  const ProcessInvoker* invoker = nullptr;

  std::unique_ptr<EvaluationContext> context;
  std::vector<const ProcessDefinition*> processes;
  std::vector<int> pending;
  std::vector<int> states;

  std::atomic<int> remaining{0};
  // run() may free this state as soon as it observes finished, so the last
  // node signals under done_mutex and touches nothing afterwards.
  std::mutex done_mutex;
  std::condition_variable done_cv;
  bool finished = false;
  std::atomic<bool> aborted{false};
  std::atomic<bool> has_error{false};
  std::mutex error_mutex;
  EngineError error;

  auto schedule_initial_nodes() -> void;
  auto schedule_node(int node_index) -> void;
  auto execute_node(int node_index) -> void;
  auto complete_node(int node_index, NodeState state) -> void;
  auto record_error(EngineError failure) -> void;
  auto wait_for_completion() -> void;
};

struct WorkItem {
  ExecutionState* state = nullptr;
  int node_index = -1;
};

struct WorkQueue {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<WorkItem> items;
  bool stopped = false;

  auto push(WorkItem item) -> void {
    std::lock_guard<std::mutex> lock(mutex);
    items.push_back(item);
    cv.notify_one();
  }

  auto pop(WorkItem& out) -> bool {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return stopped || !items.empty(); });
    if (items.empty()) {
      return false;
    }
    out = items.front();
    items.pop_front();
    return true;
  }

  auto stop() -> void {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopped) {
        return;
      }
      stopped = true;
    }
    cv.notify_all();
  }
};

struct Dispatcher : std::enable_shared_from_this<Dispatcher> {
  WorkQueue queue;
  int workers = 0;
  std::atomic<int> alive{0};
  std::atomic<bool> started{false};

  explicit Dispatcher(int workers) : workers(workers) {}

  auto enqueue(WorkItem item) -> void { queue.push(item); }

  auto start(exec::static_thread_pool& pool) -> void {
    bool expected = false;
    if (!started.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return;
    }
    alive.store(workers, std::memory_order_release);
    auto scheduler = pool.get_scheduler();
    for (int i = 0; i < workers; ++i) {
      // Each worker owns a reference: stop() may return before the last
      // worker has finished signalling alive.
      auto task = stdexec::schedule(scheduler)
        | stdexec::then([self = shared_from_this()]() { self->worker_loop(); });
      stdexec::start_detached(std::move(task));
    }
  }

  auto stop() -> void {
    if (!started.load(std::memory_order_acquire)) {
      return;
    }
    queue.stop();
    int count = alive.load(std::memory_order_acquire);
    while (count != 0) {
      alive.wait(count, std::memory_order_relaxed);
      count = alive.load(std::memory_order_acquire);
    }
  }

 private:
  auto worker_loop() -> void {
    WorkItem item{};
    while (queue.pop(item)) {
      item.state->execute_node(item.node_index);
    }
    if (alive.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      alive.notify_all();
    }
  }
};

auto ExecutionState::schedule_initial_nodes() -> void {
  for (std::size_t node_index = 0; node_index < pending.size(); ++node_index) {
    if (std::atomic_ref<int>(pending[node_index]).load(std::memory_order_relaxed) == 0) {
      schedule_node(static_cast<int>(node_index));
    }
  }
}

auto ExecutionState::schedule_node(int node_index) -> void {
  int expected = NodeState::Pending;
  if (!std::atomic_ref<int>(states[static_cast<std::size_t>(node_index)])
         .compare_exchange_strong(expected, NodeState::Scheduled, std::memory_order_acq_rel)) {
    return;
  }
  dispatcher->enqueue(WorkItem{this, node_index});
}

auto ExecutionState::execute_node(int node_index) -> void {
  const auto& node = graph->nodes[static_cast<std::size_t>(node_index)];

  // A failure elsewhere means this node's result can no longer be used.
  if (aborted.load(std::memory_order_acquire)) {
    pg::log::trace("skipping node '{}' after failure", node.id);
    complete_node(node_index, NodeState::Skipped);
    return;
  }

  pg::log::debug("dispatch node '{}' ({})", node.id, node.process_id);
  auto fail = [&](EngineError failure) {
    failure.node_id = node.id;
    pg::log::warn("node '{}' failed: {} ({})", node.id, failure.message, to_string(failure.kind));
    record_error(std::move(failure));
    complete_node(node_index, NodeState::Failed);
  };

  try {
    auto arguments = resolve_arguments(node, *context);
    if (!arguments) {
      fail(arguments.error());
      return;
    }
    auto value = invoker->call(*processes[static_cast<std::size_t>(node_index)], *arguments, 0);
    if (!value) {
      fail(value.error());
      return;
    }
    if (!context->record(node_index, std::move(*value))) {
      fail(make_error(ErrorKind::ProcessExecutionFailure, std::format("output of node '{}' recorded twice", node.id)));
      return;
    }
  } catch (const std::exception& ex) {
    fail(make_error(ErrorKind::ProcessExecutionFailure, ex.what()));
    return;
  }
  complete_node(node_index, NodeState::Done);
}

auto ExecutionState::complete_node(int node_index, NodeState state) -> void {
  std::atomic_ref<int>(states[static_cast<std::size_t>(node_index)]).store(state, std::memory_order_release);
  for (int dependent : plan->dependents[static_cast<std::size_t>(node_index)]) {
    if (std::atomic_ref<int>(pending[static_cast<std::size_t>(dependent)])
          .fetch_sub(1, std::memory_order_acq_rel) == 1) {
      schedule_node(dependent);
    }
  }
  if (remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    std::lock_guard<std::mutex> lock(done_mutex);
    finished = true;
    done_cv.notify_all();
  }
}

auto ExecutionState::record_error(EngineError failure) -> void {
  bool expected = false;
  if (has_error.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    std::lock_guard<std::mutex> lock(error_mutex);
    error = std::move(failure);
  }
  aborted.store(true, std::memory_order_release);
}

auto ExecutionState::wait_for_completion() -> void {
  std::unique_lock<std::mutex> lock(done_mutex);
  done_cv.wait(lock, [this]() { return finished; });
}

}  // namespace

struct Executor::Pools {
  explicit Pools(int threads) : pool(static_cast<std::size_t>(threads)) {}
  exec::static_thread_pool pool;
};

struct Executor::Dispatcher {
  std::shared_ptr<::pg::engine::Dispatcher> impl;

  ~Dispatcher() {
    if (impl) {
      impl->stop();
    }
  }
};

Executor::Executor(ExecutorConfig config) : config_(config) {
  int threads = config_.worker_threads;
  if (threads <= 0) {
    threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads <= 0) {
      threads = 4;
    }
  }
  config_.worker_threads = threads;
  pools_ = std::make_shared<Pools>(threads);
  dispatcher_ = std::make_shared<Dispatcher>();
  dispatcher_->impl = std::make_shared<::pg::engine::Dispatcher>(threads);
  dispatcher_->impl->start(pools_->pool);
}

Executor::~Executor() = default;

auto Executor::run(const ProcessGraph& graph, const EvalPlan& plan, const RegistrySnapshot& registry,
                   const Json& parameters, const std::vector<ParameterSpec>* declared) const -> Expected<Json> {
  if (auto checked = check_plan(graph, plan); !checked) {
    return tl::unexpected(checked.error());
  }
  auto processes = resolve_processes(graph, registry, "process graph");
  if (!processes) {
    return tl::unexpected(processes.error());
  }

  ProcessInvoker invoker(registry, config_.max_recursion_depth);
  auto state = std::make_unique<ExecutionState>();
  const std::size_t node_count = graph.nodes.size();
  state->graph = &graph;
  state->plan = &plan;
  state->dispatcher = dispatcher_->impl.get();
  state->invoker = &invoker;
  state->context = std::make_unique<EvaluationContext>(graph, plan, parameters, declared);
  state->processes = std::move(*processes);
  state->pending = plan.pending_counts;
  state->states.assign(node_count, NodeState::Pending);
  state->remaining.store(static_cast<int>(node_count), std::memory_order_release);
  state->finished = node_count == 0;

  state->schedule_initial_nodes();
  state->wait_for_completion();

  if (state->has_error.load(std::memory_order_acquire)) {
    std::lock_guard<std::mutex> lock(state->error_mutex);
    return tl::unexpected(state->error);
  }
  const auto* result = state->context->result();
  if (!result) {
    return tl::unexpected(make_error(ErrorKind::MalformedGraph, "result node produced no value",
                                     graph.nodes[static_cast<std::size_t>(plan.result_index)].id));
  }
  return *result;
}

}  // namespace pg::engine
