#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace pg::engine {

struct SchemaIssue {
  /// JSON pointer of the offending value, relative to the checked root.
  std::string path;
  std::string message;
};

/// Checks value against the JSON Schema subset used by openEO process
/// descriptions: type, const, enum, numeric ranges, string length and
/// pattern, array items, object properties, anyOf/oneOf/allOf/not. A schema
/// given as an array means "any of". Every violation is reported.
auto check_schema(const Json& schema, const Json& value, std::string_view path = {})
  -> std::vector<SchemaIssue>;

auto matches_schema(const Json& schema, const Json& value) -> bool;

/// Binds supplied values to declared parameters: reports missing required and
/// undeclared parameters plus every schema violation, and fills in defaults
/// of absent optional parameters.
auto bind_parameters(const std::vector<ParameterSpec>& declared, const Json& supplied,
                     std::string_view process_id) -> Expected<Json>;

/// Checks a process result against its declared return schema.
auto check_return_value(const ReturnSpec& returns, const Json& value, std::string_view process_id)
  -> Expected<void>;

}  // namespace pg::engine
