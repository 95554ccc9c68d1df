#include "engine/error.hpp"

#include <format>

namespace pg::engine {

auto make_bulk_error(std::string message, std::vector<EngineError> issues) -> EngineError {
  EngineError error;
  if (!issues.empty()) {
    error.kind = issues.front().kind;
    error.node_id = issues.front().node_id;
  } else {
    error.kind = ErrorKind::MalformedGraph;
  }
  error.message = std::move(message);
  error.issues = std::move(issues);
  return error;
}

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::MalformedGraph:
      return "MalformedGraph";
    case ErrorKind::AmbiguousOrMissingResult:
      return "AmbiguousOrMissingResult";
    case ErrorKind::DanglingReference:
      return "DanglingReference";
    case ErrorKind::CyclicDependency:
      return "CyclicDependency";
    case ErrorKind::UnknownProcess:
      return "UnknownProcess";
    case ErrorKind::SchemaViolation:
      return "SchemaViolation";
    case ErrorKind::UnboundParameter:
      return "UnboundParameter";
    case ErrorKind::RecursionLimitExceeded:
      return "RecursionLimitExceeded";
    case ErrorKind::ProcessExecutionFailure:
      return "ProcessExecutionFailure";
    case ErrorKind::InvalidProcessDefinition:
      return "InvalidProcessDefinition";
  }
  return "Unknown";
}

auto to_string(SchemaSide side) -> std::string_view {
  switch (side) {
    case SchemaSide::None:
      return "none";
    case SchemaSide::Argument:
      return "argument";
    case SchemaSide::Return:
      return "return";
  }
  return "none";
}

auto EngineError::describe() const -> std::string {
  std::string text = std::format("[{}] {}", to_string(kind), message);
  if (!node_id.empty()) {
    text += std::format(" (node: {})", node_id);
  }
  for (const auto& frame : call_path) {
    text += std::format("\n  at {}", frame);
  }
  for (const auto& issue : issues) {
    text += "\n  - " + issue.describe();
  }
  return text;
}

auto to_json(const EngineError& error) -> nlohmann::json {
  nlohmann::json json = {
    {"code", std::string(to_string(error.kind))},
    {"message", error.message},
  };
  if (!error.node_id.empty()) {
    json["node_id"] = error.node_id;
  }
  if (!error.parameter.empty()) {
    json["parameter"] = error.parameter;
  }
  if (error.side != SchemaSide::None) {
    json["side"] = std::string(to_string(error.side));
  }
  if (!error.nodes.empty()) {
    json["nodes"] = error.nodes;
  }
  if (!error.call_path.empty()) {
    json["call_path"] = error.call_path;
  }
  if (!error.issues.empty()) {
    auto issues = nlohmann::json::array();
    for (const auto& issue : error.issues) {
      issues.push_back(to_json(issue));
    }
    json["issues"] = std::move(issues);
  }
  return json;
}

}  // namespace pg::engine
