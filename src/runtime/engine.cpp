#include "runtime/engine.hpp"

#include <chrono>
#include <format>
#include <string>

#include "common/logging/log.hpp"
#include "engine/schema.hpp"

namespace pg::engine {
namespace {

auto async_thread_count(const EngineConfig& config) -> std::size_t {
  return static_cast<std::size_t>(config.async_threads > 0 ? config.async_threads : 1);
}

auto parse_text(std::string_view text) -> Expected<Json> {
  auto document = Json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return tl::unexpected(make_error(ErrorKind::MalformedGraph, "document is not valid JSON"));
  }
  return document;
}

}  // namespace

Engine::Engine(EngineConfig config)
    : executor_(config.executor), async_pool_(async_thread_count(config)) {
  pg::log::init();
  pg::log::info("engine started: {} evaluation threads, recursion limit {}", executor_.config().worker_threads,
                executor_.config().max_recursion_depth);
}

Engine::~Engine() = default;

auto Engine::create(EngineConfig config, const ProcessInstaller& installer) -> Expected<std::unique_ptr<Engine>> {
  auto engine = std::make_unique<Engine>(config);
  if (installer) {
    if (auto installed = installer(engine->registry_); !installed) {
      pg::log::error("failed to install built-in processes: {}", installed.error().message);
      return tl::unexpected(installed.error());
    }
  }
  engine->registry_.freeze_builtins();
  pg::log::info("registered {} built-in processes", engine->registry_.list().size());
  return engine;
}

auto Engine::registry() -> ProcessRegistry& { return registry_; }

auto Engine::registry() const -> const ProcessRegistry& { return registry_; }

auto Engine::prepare(const Json& document, std::string_view owner, std::vector<EngineError>& issues) const
  -> Prepared {
  Prepared prepared;
  prepared.document = parse_graph_document(document, issues);
  const auto& graph = prepared.document.graph;
  prepared.plan = build_plan(graph, issues);
  if (prepared.document.declares_parameters) {
    collect_parameter_issues(graph, prepared.document.parameters, issues);
  }
  prepared.snapshot = registry_.snapshot(owner);
  for (const auto& node : graph.nodes) {
    if (node.well_formed && !prepared.snapshot->find(node.process_id)) {
      issues.push_back(make_error(ErrorKind::UnknownProcess,
                                  std::format("node '{}' uses unknown process '{}'", node.id, node.process_id),
                                  node.id));
    }
  }
  return prepared;
}

auto Engine::validate(const Json& document, std::string_view owner) const -> std::vector<EngineError> {
  std::vector<EngineError> issues;
  prepare(document, owner, issues);
  return issues;
}

auto Engine::validate_text(std::string_view text, std::string_view owner) const -> std::vector<EngineError> {
  auto document = parse_text(text);
  if (!document) {
    return {document.error()};
  }
  return validate(*document, owner);
}

auto Engine::evaluate(const Json& document, const Json& parameters, std::string_view owner) const
  -> Expected<Json> {
  auto started = std::chrono::steady_clock::now();
  std::vector<EngineError> issues;
  auto prepared = prepare(document, owner, issues);
  if (!issues.empty()) {
    pg::log::warn("rejected process graph with {} structural issues: {}", issues.size(), issues.front().message);
    return tl::unexpected(make_bulk_error("process graph is invalid", std::move(issues)));
  }

  if (nesting_exceeds(parameters, kMaxNestingDepth)) {
    auto error = make_error(ErrorKind::SchemaViolation,
                            std::format("external parameters nest deeper than {} levels", kMaxNestingDepth));
    error.side = SchemaSide::Argument;
    pg::log::warn("rejected parameters: {}", error.message);
    return tl::unexpected(std::move(error));
  }

  const auto& declared = prepared.document;
  Json bound = parameters.is_object() ? parameters : Json::object();
  if (declared.declares_parameters) {
    auto checked = bind_parameters(declared.parameters, bound, "process graph");
    if (!checked) {
      pg::log::warn("rejected parameters: {}", checked.error().message);
      return tl::unexpected(checked.error());
    }
    bound = std::move(*checked);
  }

  auto result = executor_.run(declared.graph, prepared.plan, *prepared.snapshot, bound,
                              declared.declares_parameters ? &declared.parameters : nullptr);
  if (result && declared.returns) {
    if (auto returned = check_return_value(*declared.returns, *result, "process graph"); !returned) {
      result = tl::unexpected(returned.error());
    }
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
  pg::log::Fields fields{
    {"owner", std::string(owner)},
    {"nodes", std::to_string(declared.graph.nodes.size())},
    {"elapsed_us", std::to_string(elapsed.count())},
    {"status", result ? "ok" : std::string(to_string(result.error().kind))},
  };
  if (!result && !result.error().node_id.empty()) {
    fields.emplace_back("node", result.error().node_id);
  }
  pg::log::event(result ? spdlog::level::info : spdlog::level::warn, "evaluation", fields);
  return result;
}

auto Engine::evaluate_text(std::string_view text, const Json& parameters, std::string_view owner) const
  -> Expected<Json> {
  auto document = parse_text(text);
  if (!document) {
    return tl::unexpected(document.error());
  }
  return evaluate(*document, parameters, owner);
}

auto Engine::put_user_defined(std::string_view owner, const Json& definition)
  -> Expected<std::shared_ptr<const ProcessDefinition>> {
  return registry_.put_user_defined(owner, definition);
}

auto Engine::remove_user_defined(std::string_view owner, std::string_view id) -> bool {
  return registry_.remove_user_defined(owner, id);
}

auto Engine::describe_process(std::string_view owner, std::string_view id) const -> std::optional<Json> {
  auto definition = registry_.find(id, owner);
  if (!definition) {
    return std::nullopt;
  }
  return to_json(*definition);
}

auto Engine::list_processes(std::string_view owner) const -> Json {
  auto processes = Json::array();
  for (const auto& definition : registry_.list(owner)) {
    processes.push_back(to_json(*definition));
  }
  return Json{{"processes", std::move(processes)}};
}

}  // namespace pg::engine
