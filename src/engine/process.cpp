#include "engine/process.hpp"

#include <format>
#include <utility>

namespace pg::engine {
namespace {

auto read_flag(const Json& json, const char* key, std::string_view context, std::vector<EngineError>& issues)
  -> bool {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                std::format("{}: '{}' must be a boolean", context, key)));
    return false;
  }
  return it->get<bool>();
}

auto read_text(const Json& json, const char* key) -> std::string {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

auto parse_process_metadata(const Json& json, std::vector<EngineError>& issues) -> ProcessDefinition {
  ProcessDefinition definition;
  if (!json.is_object()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition, "process definition must be an object"));
    return definition;
  }

  auto id_it = json.find("id");
  if (id_it == json.end() || !id_it->is_string() || id_it->get_ref<const std::string&>().empty()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition, "process definition is missing an id"));
  } else {
    definition.id = id_it->get<std::string>();
  }
  const std::string context = definition.id.empty() ? std::string("process") : definition.id;

  definition.summary = read_text(json, "summary");
  definition.description = read_text(json, "description");
  if (auto it = json.find("categories"); it != json.end() && it->is_array()) {
    for (const auto& category : *it) {
      if (category.is_string()) {
        definition.categories.push_back(category.get<std::string>());
      }
    }
  }
  if (auto it = json.find("parameters"); it != json.end()) {
    definition.parameters = parse_parameter_specs(*it, context, issues);
  }
  if (auto it = json.find("returns"); it != json.end()) {
    definition.returns = parse_return_spec(*it, context, issues);
  }
  definition.deprecated = read_flag(json, "deprecated", context, issues);
  definition.experimental = read_flag(json, "experimental", context, issues);
  return definition;
}

auto parse_process_definition(const Json& json, std::string owner) -> Expected<ProcessDefinition> {
  std::vector<EngineError> issues;
  auto definition = parse_process_metadata(json, issues);

  UserDefinedProcess body;
  body.owner = std::move(owner);
  auto graph_it = json.is_object() ? json.find("process_graph") : json.end();
  if (!json.is_object() || graph_it == json.end()) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                std::format("process '{}' has no process_graph", definition.id)));
  } else {
    body.graph = parse_process_graph(*graph_it, issues);
    body.plan = build_plan(body.graph, issues);
    collect_parameter_issues(body.graph, definition.parameters, issues);
  }

  if (!issues.empty()) {
    auto count = issues.size();
    auto error = make_bulk_error(
      std::format("user-defined process '{}' is invalid ({} issues)", definition.id, count), std::move(issues));
    return tl::unexpected(std::move(error));
  }
  // Copied only once validated, so nesting is already bounded.
  body.source = *graph_it;
  definition.body = std::move(body);
  return definition;
}

auto make_builtin(const Json& description, InvokeFn invoke) -> Expected<ProcessDefinition> {
  std::vector<EngineError> issues;
  auto definition = parse_process_metadata(description, issues);
  if (!invoke) {
    issues.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                std::format("built-in process '{}' has no implementation", definition.id)));
  }
  if (!issues.empty()) {
    auto count = issues.size();
    return tl::unexpected(make_bulk_error(
      std::format("built-in process '{}' is invalid ({} issues)", definition.id, count), std::move(issues)));
  }
  definition.body = BuiltinProcess{std::move(invoke)};
  return definition;
}

auto to_json(const ProcessDefinition& definition) -> Json {
  Json json = {
    {"id", definition.id},
    {"summary", definition.summary},
    {"description", definition.description},
    {"categories", definition.categories},
    {"parameters", parameter_specs_to_json(definition.parameters)},
    {"returns", Json{{"description", definition.returns.description}, {"schema", definition.returns.schema}}},
  };
  if (definition.deprecated) {
    json["deprecated"] = true;
  }
  if (definition.experimental) {
    json["experimental"] = true;
  }
  if (const auto* body = std::get_if<UserDefinedProcess>(&definition.body)) {
    json["process_graph"] = body->source;
  }
  return json;
}

}  // namespace pg::engine
