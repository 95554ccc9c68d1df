#include "engine/schema.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <optional>
#include <regex>
#include <unordered_set>
#include <utility>

namespace pg::engine {
namespace {

auto child_path(std::string_view path, std::string_view key) -> std::string {
  return std::format("{}/{}", path, key);
}

auto display_path(std::string_view path) -> std::string {
  return path.empty() ? std::string("/") : std::string(path);
}

auto type_name(const Json& value) -> std::string_view {
  switch (value.type()) {
    case Json::value_t::null:
      return "null";
    case Json::value_t::boolean:
      return "boolean";
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
      return "integer";
    case Json::value_t::number_float:
      return "number";
    case Json::value_t::string:
      return "string";
    case Json::value_t::array:
      return "array";
    case Json::value_t::object:
      return "object";
    default:
      return "unknown";
  }
}

auto matches_type(std::string_view type, const Json& value) -> bool {
  if (type == "null") {
    return value.is_null();
  }
  if (type == "boolean") {
    return value.is_boolean();
  }
  if (type == "number") {
    return value.is_number();
  }
  if (type == "integer") {
    if (value.is_number_integer()) {
      return true;
    }
    if (value.is_number_float()) {
      double number = value.get<double>();
      return std::isfinite(number) && std::floor(number) == number;
    }
    return false;
  }
  if (type == "string") {
    return value.is_string();
  }
  if (type == "array") {
    return value.is_array();
  }
  if (type == "object") {
    return value.is_object();
  }
  // Unknown type names (openEO subtypes live in "subtype") do not restrict.
  return true;
}

auto read_count(const Json& schema, const char* key) -> std::optional<std::size_t> {
  auto it = schema.find(key);
  if (it == schema.end() || !it->is_number_integer() || it->get<std::int64_t>() < 0) {
    return std::nullopt;
  }
  return it->get<std::size_t>();
}

struct Checker {
  std::vector<SchemaIssue>& issues;

  auto add(std::string_view path, std::string message) -> void {
    issues.push_back(SchemaIssue{display_path(path), std::move(message)});
  }

  auto check(const Json& schema, const Json& value, std::string_view path) -> void {
    if (schema.is_array()) {
      check_any_of(schema, value, path);
      return;
    }
    if (!schema.is_object()) {
      return;
    }

    if (auto it = schema.find("type"); it != schema.end()) {
      if (!check_type(*it, value, path)) {
        return;
      }
    }
    if (auto it = schema.find("const"); it != schema.end() && *it != value) {
      add(path, std::format("value must equal {}", it->dump()));
    }
    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
      bool found = false;
      for (const auto& allowed : *it) {
        found = found || allowed == value;
      }
      if (!found) {
        add(path, std::format("value {} is not one of {}", value.dump(), it->dump()));
      }
    }

    if (value.is_number()) {
      check_number(schema, value.get<double>(), path);
    } else if (value.is_string()) {
      check_string(schema, value.get_ref<const std::string&>(), path);
    } else if (value.is_array()) {
      check_array(schema, value, path);
    } else if (value.is_object()) {
      check_object(schema, value, path);
    }

    if (auto it = schema.find("allOf"); it != schema.end() && it->is_array()) {
      for (const auto& branch : *it) {
        check(branch, value, path);
      }
    }
    if (auto it = schema.find("anyOf"); it != schema.end()) {
      check_any_of(*it, value, path);
    }
    if (auto it = schema.find("oneOf"); it != schema.end() && it->is_array()) {
      std::size_t matched = 0;
      for (const auto& branch : *it) {
        matched += matches_schema(branch, value) ? 1 : 0;
      }
      if (matched != 1) {
        add(path, std::format("value must match exactly one schema, matched {}", matched));
      }
    }
    if (auto it = schema.find("not"); it != schema.end() && matches_schema(*it, value)) {
      add(path, "value must not match the excluded schema");
    }
  }

  auto check_type(const Json& type, const Json& value, std::string_view path) -> bool {
    if (type.is_string()) {
      if (matches_type(type.get_ref<const std::string&>(), value)) {
        return true;
      }
      add(path, std::format("expected {}, got {}", type.get<std::string>(), type_name(value)));
      return false;
    }
    if (type.is_array()) {
      for (const auto& candidate : type) {
        if (candidate.is_string() && matches_type(candidate.get_ref<const std::string&>(), value)) {
          return true;
        }
      }
      add(path, std::format("expected one of {}, got {}", type.dump(), type_name(value)));
      return false;
    }
    return true;
  }

  auto check_any_of(const Json& branches, const Json& value, std::string_view path) -> void {
    if (!branches.is_array() || branches.empty()) {
      return;
    }
    for (const auto& branch : branches) {
      if (matches_schema(branch, value)) {
        return;
      }
    }
    add(path, std::format("value {} matches none of the allowed schemas", value.dump()));
  }

  auto check_number(const Json& schema, double number, std::string_view path) -> void {
    if (auto it = schema.find("minimum"); it != schema.end() && it->is_number()) {
      double minimum = it->get<double>();
      bool exclusive = false;
      if (auto ex = schema.find("exclusiveMinimum"); ex != schema.end() && ex->is_boolean()) {
        exclusive = ex->get<bool>();
      }
      if (exclusive ? number <= minimum : number < minimum) {
        add(path, std::format("value {} must be {} {}", number, exclusive ? ">" : ">=", minimum));
      }
    }
    if (auto it = schema.find("maximum"); it != schema.end() && it->is_number()) {
      double maximum = it->get<double>();
      bool exclusive = false;
      if (auto ex = schema.find("exclusiveMaximum"); ex != schema.end() && ex->is_boolean()) {
        exclusive = ex->get<bool>();
      }
      if (exclusive ? number >= maximum : number > maximum) {
        add(path, std::format("value {} must be {} {}", number, exclusive ? "<" : "<=", maximum));
      }
    }
    if (auto it = schema.find("exclusiveMinimum"); it != schema.end() && it->is_number()) {
      if (number <= it->get<double>()) {
        add(path, std::format("value {} must be > {}", number, it->get<double>()));
      }
    }
    if (auto it = schema.find("exclusiveMaximum"); it != schema.end() && it->is_number()) {
      if (number >= it->get<double>()) {
        add(path, std::format("value {} must be < {}", number, it->get<double>()));
      }
    }
  }

  auto check_string(const Json& schema, const std::string& text, std::string_view path) -> void {
    if (auto limit = read_count(schema, "minLength"); limit && text.size() < *limit) {
      add(path, std::format("string must have at least {} characters", *limit));
    }
    if (auto limit = read_count(schema, "maxLength"); limit && text.size() > *limit) {
      add(path, std::format("string must have at most {} characters", *limit));
    }
    if (auto it = schema.find("pattern"); it != schema.end() && it->is_string()) {
      try {
        std::regex pattern(it->get<std::string>(), std::regex::ECMAScript);
        if (!std::regex_search(text, pattern)) {
          add(path, std::format("string does not match pattern {}", it->get<std::string>()));
        }
      } catch (const std::regex_error& ex) {
        add(path, std::format("schema pattern is invalid: {}", ex.what()));
      }
    }
  }

  auto check_array(const Json& schema, const Json& array, std::string_view path) -> void {
    if (auto limit = read_count(schema, "minItems"); limit && array.size() < *limit) {
      add(path, std::format("array must have at least {} items", *limit));
    }
    if (auto limit = read_count(schema, "maxItems"); limit && array.size() > *limit) {
      add(path, std::format("array must have at most {} items", *limit));
    }
    if (auto it = schema.find("uniqueItems"); it != schema.end() && it->is_boolean() && it->get<bool>()) {
      std::unordered_set<std::string> seen;
      for (const auto& item : array) {
        if (!seen.insert(item.dump()).second) {
          add(path, std::format("array items must be unique, {} repeats", item.dump()));
          break;
        }
      }
    }
    if (auto it = schema.find("items"); it != schema.end()) {
      if (it->is_object()) {
        for (std::size_t i = 0; i < array.size(); ++i) {
          check(*it, array[i], child_path(path, std::to_string(i)));
        }
      } else if (it->is_array()) {
        for (std::size_t i = 0; i < array.size() && i < it->size(); ++i) {
          check((*it)[i], array[i], child_path(path, std::to_string(i)));
        }
      }
    }
  }

  auto check_object(const Json& schema, const Json& object, std::string_view path) -> void {
    if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
      for (const auto& name : *it) {
        if (name.is_string() && !object.contains(name.get<std::string>())) {
          add(path, std::format("missing required property '{}'", name.get<std::string>()));
        }
      }
    }
    const Json* properties = nullptr;
    if (auto it = schema.find("properties"); it != schema.end() && it->is_object()) {
      properties = &*it;
    }
    const Json* additional = nullptr;
    if (auto it = schema.find("additionalProperties"); it != schema.end()) {
      additional = &*it;
    }
    for (const auto& [key, member] : object.items()) {
      if (properties) {
        if (auto property = properties->find(key); property != properties->end()) {
          check(*property, member, child_path(path, key));
          continue;
        }
      }
      if (!additional) {
        continue;
      }
      if (additional->is_boolean()) {
        if (!additional->get<bool>()) {
          add(child_path(path, key), std::format("property '{}' is not allowed", key));
        }
      } else {
        check(*additional, member, child_path(path, key));
      }
    }
  }
};

auto format_issues(const std::vector<SchemaIssue>& issues) -> std::string {
  std::string text;
  for (const auto& issue : issues) {
    if (!text.empty()) {
      text += "; ";
    }
    text += std::format("{}: {}", issue.path, issue.message);
  }
  return text;
}

}  // namespace

auto check_schema(const Json& schema, const Json& value, std::string_view path) -> std::vector<SchemaIssue> {
  std::vector<SchemaIssue> issues;
  Checker checker{issues};
  checker.check(schema, value, path);
  return issues;
}

auto matches_schema(const Json& schema, const Json& value) -> bool {
  return check_schema(schema, value).empty();
}

auto bind_parameters(const std::vector<ParameterSpec>& declared, const Json& supplied,
                     std::string_view process_id) -> Expected<Json> {
  std::vector<EngineError> issues;
  auto bound = Json::object();

  auto violation = [&](std::string parameter, std::string message) {
    auto error = make_error(ErrorKind::SchemaViolation, std::move(message));
    error.parameter = std::move(parameter);
    error.side = SchemaSide::Argument;
    issues.push_back(std::move(error));
  };

  if (!supplied.is_null() && !supplied.is_object()) {
    violation({}, std::format("arguments of process '{}' must be an object", process_id));
    return tl::unexpected(make_bulk_error(std::format("invalid arguments for process '{}'", process_id),
                                          std::move(issues)));
  }

  std::unordered_set<std::string> names;
  for (const auto& spec : declared) {
    names.insert(spec.name);
    auto it = supplied.is_object() ? supplied.find(spec.name) : supplied.end();
    if (!supplied.is_object() || it == supplied.end()) {
      if (spec.has_default) {
        bound[spec.name] = spec.default_value;
      } else if (!spec.optional) {
        violation(spec.name,
                  std::format("process '{}' is missing required parameter '{}'", process_id, spec.name));
      }
      continue;
    }
    auto schema_issues = check_schema(spec.schema, *it, "/" + spec.name);
    if (!schema_issues.empty()) {
      violation(spec.name, std::format("parameter '{}' of process '{}' is invalid: {}", spec.name, process_id,
                                       format_issues(schema_issues)));
      continue;
    }
    bound[spec.name] = *it;
  }

  if (supplied.is_object()) {
    for (const auto& [key, value] : supplied.items()) {
      if (!names.contains(key)) {
        violation(key, std::format("process '{}' has no parameter '{}'", process_id, key));
      }
    }
  }

  if (!issues.empty()) {
    auto count = issues.size();
    auto error = make_bulk_error(
      std::format("invalid arguments for process '{}' ({} issues)", process_id, count), std::move(issues));
    error.parameter = error.issues.front().parameter;
    error.side = SchemaSide::Argument;
    return tl::unexpected(std::move(error));
  }
  return bound;
}

auto check_return_value(const ReturnSpec& returns, const Json& value, std::string_view process_id)
  -> Expected<void> {
  auto issues = check_schema(returns.schema, value);
  if (issues.empty()) {
    return {};
  }
  auto error = make_error(ErrorKind::SchemaViolation,
                          std::format("return value of process '{}' is invalid: {}", process_id,
                                      format_issues(issues)));
  error.side = SchemaSide::Return;
  return tl::unexpected(std::move(error));
}

}  // namespace pg::engine
