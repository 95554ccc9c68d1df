#include "engine/dsl.hpp"

#include <format>
#include <utility>

namespace pg::engine {
namespace {

auto malformed(std::string_view node_id, std::string message) -> EngineError {
  return make_error(ErrorKind::MalformedGraph, std::move(message), std::string(node_id));
}

auto reference_target(const Json& object, std::string_view key) -> const Json* {
  auto it = object.find(std::string(key));
  if (it == object.end()) {
    return nullptr;
  }
  return &*it;
}

auto parse_node(std::string id, const Json& body, std::vector<EngineError>& issues) -> NodeDef {
  NodeDef node;
  node.id = std::move(id);

  if (!body.is_object()) {
    issues.push_back(malformed(node.id, std::format("node '{}' must be an object", node.id)));
    node.well_formed = false;
    return node;
  }

  auto process_it = body.find("process_id");
  if (process_it == body.end()) {
    issues.push_back(malformed(node.id, std::format("node '{}' is missing 'process_id'", node.id)));
    node.well_formed = false;
  } else if (!process_it->is_string() || process_it->get_ref<const std::string&>().empty()) {
    issues.push_back(malformed(node.id, std::format("node '{}': 'process_id' must be a non-empty string", node.id)));
    node.well_formed = false;
  } else {
    node.process_id = process_it->get<std::string>();
  }

  auto arguments_it = body.find("arguments");
  if (arguments_it == body.end()) {
    issues.push_back(malformed(node.id, std::format("node '{}' is missing 'arguments'", node.id)));
    node.well_formed = false;
  } else if (!arguments_it->is_object()) {
    issues.push_back(malformed(node.id, std::format("node '{}': 'arguments' must be an object", node.id)));
    node.well_formed = false;
  } else {
    node.arguments.reserve(arguments_it->size());
    for (const auto& [name, raw] : arguments_it->items()) {
      if (nesting_exceeds(raw, kMaxNestingDepth)) {
        issues.push_back(malformed(node.id, std::format("node '{}': argument '{}' nests deeper than {} levels",
                                                        node.id, name, kMaxNestingDepth)));
        node.well_formed = false;
        continue;
      }
      node.arguments.push_back(ArgumentEntry{name, classify_argument(raw, node.id, issues)});
    }
  }

  if (auto result_it = body.find("result"); result_it != body.end() && !result_it->is_null()) {
    if (!result_it->is_boolean()) {
      issues.push_back(malformed(node.id, std::format("node '{}': 'result' must be a boolean", node.id)));
      node.well_formed = false;
    } else {
      node.result = result_it->get<bool>();
    }
  }

  if (auto description_it = body.find("description");
      description_it != body.end() && !description_it->is_null()) {
    if (!description_it->is_string()) {
      issues.push_back(malformed(node.id, std::format("node '{}': 'description' must be a string", node.id)));
      node.well_formed = false;
    } else {
      node.description = description_it->get<std::string>();
    }
  }
  return node;
}

auto classify(const Json& value, std::string_view node_id, std::vector<EngineError>& issues) -> ArgumentValue {
  if (value.is_object()) {
    if (const auto* target = reference_target(value, "from_node")) {
      if (!target->is_string()) {
        issues.push_back(malformed(node_id, std::format("node '{}': 'from_node' must be a string", node_id)));
        return ArgumentValue::make_literal(value);
      }
      return ArgumentValue::make_node_reference(target->get<std::string>());
    }
    const auto* target = reference_target(value, "from_argument");
    if (!target) {
      target = reference_target(value, "from_parameter");
    }
    if (target) {
      if (!target->is_string()) {
        issues.push_back(
          malformed(node_id, std::format("node '{}': parameter reference must be a string", node_id)));
        return ArgumentValue::make_literal(value);
      }
      return ArgumentValue::make_parameter_reference(target->get<std::string>());
    }
    // Callbacks carry their own graph; references inside belong to it.
    if (value.contains("process_graph")) {
      return ArgumentValue::make_literal(value);
    }

    ArgumentValue object;
    object.kind = ArgumentKind::Object;
    bool has_reference = false;
    for (const auto& [key, member] : value.items()) {
      auto classified = classify(member, node_id, issues);
      has_reference = has_reference || classified.kind != ArgumentKind::Literal;
      object.keys.push_back(key);
      object.items.push_back(std::move(classified));
    }
    if (!has_reference) {
      return ArgumentValue::make_literal(value);
    }
    return object;
  }

  if (value.is_array()) {
    ArgumentValue array;
    array.kind = ArgumentKind::Array;
    bool has_reference = false;
    array.items.reserve(value.size());
    for (const auto& element : value) {
      auto classified = classify(element, node_id, issues);
      has_reference = has_reference || classified.kind != ArgumentKind::Literal;
      array.items.push_back(std::move(classified));
    }
    if (!has_reference) {
      return ArgumentValue::make_literal(value);
    }
    return array;
  }

  return ArgumentValue::make_literal(value);
}

}  // namespace

auto ArgumentValue::make_literal(Json value) -> ArgumentValue {
  ArgumentValue argument;
  argument.kind = ArgumentKind::Literal;
  argument.literal = std::move(value);
  return argument;
}

auto ArgumentValue::make_node_reference(std::string node_id) -> ArgumentValue {
  ArgumentValue argument;
  argument.kind = ArgumentKind::NodeReference;
  argument.target = std::move(node_id);
  return argument;
}

auto ArgumentValue::make_parameter_reference(std::string name) -> ArgumentValue {
  ArgumentValue argument;
  argument.kind = ArgumentKind::ParameterReference;
  argument.target = std::move(name);
  return argument;
}

auto is_process_wrapper(const Json& json) -> bool {
  if (!json.is_object()) {
    return false;
  }
  auto it = json.find("process_graph");
  return it != json.end() && it->is_object() && !it->contains("process_id");
}

auto nesting_exceeds(const Json& json, std::size_t limit) -> bool {
  std::vector<std::pair<const Json*, std::size_t>> stack{{&json, 0}};
  while (!stack.empty()) {
    auto [value, depth] = stack.back();
    stack.pop_back();
    if (!value->is_structured()) {
      continue;
    }
    if (depth >= limit) {
      return true;
    }
    for (const auto& child : *value) {
      stack.emplace_back(&child, depth + 1);
    }
  }
  return false;
}

auto classify_argument(const Json& value, std::string_view node_id, std::vector<EngineError>& issues)
  -> ArgumentValue {
  if (nesting_exceeds(value, kMaxNestingDepth)) {
    issues.push_back(
      malformed(node_id, std::format("node '{}': argument nests deeper than {} levels", node_id, kMaxNestingDepth)));
    return ArgumentValue::make_literal(nullptr);
  }
  return classify(value, node_id, issues);
}

auto parse_process_graph(const Json& json, std::vector<EngineError>& issues) -> ProcessGraph {
  ProcessGraph graph;
  if (!json.is_object()) {
    issues.push_back(make_error(ErrorKind::MalformedGraph, "process graph must be an object"));
    return graph;
  }

  graph.nodes.reserve(json.size());
  for (const auto& [id, body] : json.items()) {
    graph.nodes.push_back(parse_node(id, body, issues));
  }

  std::vector<std::string> result_nodes;
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    if (graph.nodes[i].result) {
      result_nodes.push_back(graph.nodes[i].id);
      if (graph.result_index < 0) {
        graph.result_index = static_cast<int>(i);
      }
    }
  }
  if (result_nodes.empty()) {
    issues.push_back(make_error(ErrorKind::AmbiguousOrMissingResult, "no result node found"));
  } else if (result_nodes.size() > 1) {
    std::string names;
    for (const auto& name : result_nodes) {
      names += names.empty() ? name : ", " + name;
    }
    auto error = make_error(ErrorKind::AmbiguousOrMissingResult,
                            std::format("multiple result nodes found: {}", names));
    error.nodes = std::move(result_nodes);
    issues.push_back(std::move(error));
    graph.result_index = -1;
  }
  return graph;
}

auto parse_process_graph(const Json& json) -> Expected<ProcessGraph> {
  std::vector<EngineError> issues;
  auto graph = parse_process_graph(json, issues);
  if (!issues.empty()) {
    auto count = issues.size();
    return tl::unexpected(make_bulk_error(std::format("process graph is invalid ({} issues)", count),
                                          std::move(issues)));
  }
  return graph;
}

auto parse_parameter_specs(const Json& json, std::string_view context, std::vector<EngineError>& issues)
  -> std::vector<ParameterSpec> {
  std::vector<ParameterSpec> parameters;
  if (json.is_null()) {
    return parameters;
  }
  if (!json.is_array()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                std::format("{}: 'parameters' must be an array", context)));
    return parameters;
  }

  for (const auto& entry : json) {
    if (!entry.is_object()) {
      issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("{}: parameter entry must be an object", context)));
      continue;
    }
    auto name_it = entry.find("name");
    if (name_it == entry.end() || !name_it->is_string() || name_it->get_ref<const std::string&>().empty()) {
      issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("{}: parameter is missing a name", context)));
      continue;
    }

    ParameterSpec spec;
    spec.name = name_it->get<std::string>();
    bool duplicate = false;
    for (const auto& existing : parameters) {
      duplicate = duplicate || existing.name == spec.name;
    }
    if (duplicate) {
      issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("{}: duplicate parameter '{}'", context, spec.name)));
      continue;
    }
    if (auto it = entry.find("description"); it != entry.end() && it->is_string()) {
      spec.description = it->get<std::string>();
    }
    if (auto it = entry.find("schema"); it != entry.end()) {
      if (nesting_exceeds(*it, kMaxNestingDepth)) {
        issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                    std::format("{}: schema of parameter '{}' nests deeper than {} levels",
                                                context, spec.name, kMaxNestingDepth)));
        continue;
      }
      if (!it->is_object() && !it->is_array()) {
        issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                    std::format("{}: schema of parameter '{}' must be an object or array",
                                                context, spec.name)));
        continue;
      }
      spec.schema = *it;
    }
    if (auto it = entry.find("optional"); it != entry.end() && !it->is_null()) {
      if (!it->is_boolean()) {
        issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                    std::format("{}: 'optional' of parameter '{}' must be a boolean",
                                                context, spec.name)));
        continue;
      }
      spec.optional = it->get<bool>();
    }
    if (auto it = entry.find("default"); it != entry.end()) {
      if (nesting_exceeds(*it, kMaxNestingDepth)) {
        issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                    std::format("{}: default of parameter '{}' nests deeper than {} levels",
                                                context, spec.name, kMaxNestingDepth)));
        continue;
      }
      spec.has_default = true;
      spec.default_value = *it;
      spec.optional = true;
    }
    parameters.push_back(std::move(spec));
  }
  return parameters;
}

auto parse_return_spec(const Json& json, std::string_view context, std::vector<EngineError>& issues)
  -> ReturnSpec {
  ReturnSpec spec;
  if (json.is_null()) {
    return spec;
  }
  if (!json.is_object()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                std::format("{}: 'returns' must be an object", context)));
    return spec;
  }
  if (auto it = json.find("description"); it != json.end() && it->is_string()) {
    spec.description = it->get<std::string>();
  }
  if (auto it = json.find("schema"); it != json.end()) {
    if (nesting_exceeds(*it, kMaxNestingDepth)) {
      issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("{}: return schema nests deeper than {} levels", context,
                                              kMaxNestingDepth)));
    } else if (!it->is_object() && !it->is_array()) {
      issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("{}: return schema must be an object or array", context)));
    } else {
      spec.schema = *it;
    }
  }
  return spec;
}

auto parse_graph_document(const Json& json, std::vector<EngineError>& issues) -> GraphDocument {
  GraphDocument document;
  if (!is_process_wrapper(json)) {
    document.graph = parse_process_graph(json, issues);
    return document;
  }

  document.graph = parse_process_graph(json.at("process_graph"), issues);
  if (auto it = json.find("parameters"); it != json.end()) {
    std::vector<EngineError> declaration_issues;
    document.parameters = parse_parameter_specs(*it, "process", declaration_issues);
    document.declares_parameters = true;
    for (auto& issue : declaration_issues) {
      issue.kind = ErrorKind::MalformedGraph;
      issues.push_back(std::move(issue));
    }
  }
  if (auto it = json.find("returns"); it != json.end()) {
    std::vector<EngineError> declaration_issues;
    document.returns = parse_return_spec(*it, "process", declaration_issues);
    for (auto& issue : declaration_issues) {
      issue.kind = ErrorKind::MalformedGraph;
      issues.push_back(std::move(issue));
    }
  }
  return document;
}

auto parameter_specs_to_json(const std::vector<ParameterSpec>& parameters) -> Json {
  auto json = Json::array();
  for (const auto& spec : parameters) {
    Json entry = {
      {"name", spec.name},
      {"description", spec.description},
      {"schema", spec.schema},
    };
    if (spec.optional) {
      entry["optional"] = true;
    }
    if (spec.has_default) {
      entry["default"] = spec.default_value;
    }
    json.push_back(std::move(entry));
  }
  return json;
}

auto collect_references(const ArgumentValue& value, std::vector<std::string>& node_ids,
                        std::vector<std::string>& parameter_names) -> void {
  switch (value.kind) {
    case ArgumentKind::Literal:
      return;
    case ArgumentKind::NodeReference:
      node_ids.push_back(value.target);
      return;
    case ArgumentKind::ParameterReference:
      parameter_names.push_back(value.target);
      return;
    case ArgumentKind::Array:
    case ArgumentKind::Object:
      for (const auto& item : value.items) {
        collect_references(item, node_ids, parameter_names);
      }
      return;
  }
}

}  // namespace pg::engine
