#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pg::engine {

using Json = nlohmann::json;

enum class ArgumentKind {
  Literal,
  NodeReference,
  ParameterReference,
  Array,
  Object,
};

/// Normalized form of one argument slot. Array and Object are only produced
/// when some element below them is a reference; reference-free subtrees stay
/// a single Literal.
struct ArgumentValue {
  ArgumentKind kind = ArgumentKind::Literal;
  Json literal;
  /// Referenced node id or parameter name.
  std::string target;
  std::vector<ArgumentValue> items;
  /// Member names for Object, parallel to items.
  std::vector<std::string> keys;

  static auto make_literal(Json value) -> ArgumentValue;
  static auto make_node_reference(std::string node_id) -> ArgumentValue;
  static auto make_parameter_reference(std::string name) -> ArgumentValue;

  auto is_reference() const -> bool {
    return kind == ArgumentKind::NodeReference || kind == ArgumentKind::ParameterReference;
  }
};

struct ArgumentEntry {
  std::string name;
  ArgumentValue value;
};

struct ParameterSpec {
  std::string name;
  std::string description;
  Json schema = Json::object();
  bool optional = false;
  bool has_default = false;
  Json default_value;
};

struct ReturnSpec {
  std::string description;
  Json schema = Json::object();
};

}  // namespace pg::engine
