#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace pg::engine {

enum class ErrorKind {
  MalformedGraph,
  AmbiguousOrMissingResult,
  DanglingReference,
  CyclicDependency,
  UnknownProcess,
  SchemaViolation,
  UnboundParameter,
  RecursionLimitExceeded,
  ProcessExecutionFailure,
  InvalidProcessDefinition,
};

/// Which side of a process call a schema violation was detected on.
enum class SchemaSide {
  None,
  Argument,
  Return,
};

struct EngineError {
  ErrorKind kind = ErrorKind::ProcessExecutionFailure;
  std::string message;
  /// Offending node within the graph being evaluated, when known.
  std::string node_id;
  /// Offending parameter or argument name, when known.
  std::string parameter;
  SchemaSide side = SchemaSide::None;
  /// Cycle members or result nodes, depending on kind.
  std::vector<std::string> nodes;
  /// Outermost first: "node@process" entries for nested user-defined calls.
  std::vector<std::string> call_path;
  /// Every accumulated structural issue, for failures reported in bulk.
  std::vector<EngineError> issues;

  auto describe() const -> std::string;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorKind kind, std::string message, std::string node_id = {}) -> EngineError {
  EngineError error;
  error.kind = kind;
  error.message = std::move(message);
  error.node_id = std::move(node_id);
  return error;
}

/// Fold a list of issues into one error; the kind of the first issue wins.
auto make_bulk_error(std::string message, std::vector<EngineError> issues) -> EngineError;

auto to_string(ErrorKind kind) -> std::string_view;
auto to_string(SchemaSide side) -> std::string_view;

auto to_json(const EngineError& error) -> nlohmann::json;

}  // namespace pg::engine
