#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"

namespace pg::engine {

/// Capability through which a built-in process is invoked with its bound
/// arguments. Implementations must not touch other nodes' state.
using InvokeFn = std::function<Expected<Json>(const Json& arguments)>;

struct BuiltinProcess {
  InvokeFn invoke;
};

struct UserDefinedProcess {
  std::string owner;
  ProcessGraph graph;
  EvalPlan plan;
  /// The process graph as submitted, kept for describe/store.
  Json source;
};

enum class ProcessKind {
  Builtin,
  UserDefined,
};

struct ProcessDefinition {
  std::string id;
  std::string summary;
  std::string description;
  std::vector<std::string> categories;
  std::vector<ParameterSpec> parameters;
  ReturnSpec returns;
  bool deprecated = false;
  bool experimental = false;
  std::variant<BuiltinProcess, UserDefinedProcess> body;

  auto kind() const -> ProcessKind {
    return std::holds_alternative<BuiltinProcess>(body) ? ProcessKind::Builtin : ProcessKind::UserDefined;
  }
};

/// Reads the openEO description fields (id, summary, parameters, returns...)
/// shared by both process kinds; the body is left empty.
auto parse_process_metadata(const Json& json, std::vector<EngineError>& issues) -> ProcessDefinition;

/// Parses and validates a user-defined process document. Process ids used
/// inside the graph are not resolved here; that happens per evaluation.
auto parse_process_definition(const Json& json, std::string owner) -> Expected<ProcessDefinition>;

auto make_builtin(const Json& description, InvokeFn invoke) -> Expected<ProcessDefinition>;

auto to_json(const ProcessDefinition& definition) -> Json;

}  // namespace pg::engine
