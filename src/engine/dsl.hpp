#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace pg::engine {

struct NodeDef {
  std::string id;
  std::string process_id;
  std::vector<ArgumentEntry> arguments;
  bool result = false;
  std::string description;
  /// False when the node body was rejected; the id is kept so references to
  /// it are not reported as dangling a second time.
  bool well_formed = true;
};

struct ProcessGraph {
  std::vector<NodeDef> nodes;
  int result_index = -1;
};

/// A graph plus the declarations that come with an openEO process object.
struct GraphDocument {
  ProcessGraph graph;
  bool declares_parameters = false;
  std::vector<ParameterSpec> parameters;
  std::optional<ReturnSpec> returns;
};

/// Deepest array/object nesting accepted inside arguments, parameter
/// declarations and external parameters.
inline constexpr std::size_t kMaxNestingDepth = 256;

/// True when json nests arrays or objects more than limit levels deep.
/// Walks the value without recursion.
auto nesting_exceeds(const Json& json, std::size_t limit) -> bool;

/// True when json is a process object wrapping its graph under "process_graph".
auto is_process_wrapper(const Json& json) -> bool;

/// Normalizes one raw argument value. Problems are appended to issues; a
/// value nested deeper than kMaxNestingDepth is rejected and becomes null.
auto classify_argument(const Json& value, std::string_view node_id, std::vector<EngineError>& issues)
  -> ArgumentValue;

/// Best-effort parse that keeps going after errors and appends every problem
/// found to issues.
auto parse_process_graph(const Json& json, std::vector<EngineError>& issues) -> ProcessGraph;

auto parse_process_graph(const Json& json) -> Expected<ProcessGraph>;

auto parse_parameter_specs(const Json& json, std::string_view context, std::vector<EngineError>& issues)
  -> std::vector<ParameterSpec>;

auto parse_return_spec(const Json& json, std::string_view context, std::vector<EngineError>& issues)
  -> ReturnSpec;

auto parse_graph_document(const Json& json, std::vector<EngineError>& issues) -> GraphDocument;

auto parameter_specs_to_json(const std::vector<ParameterSpec>& parameters) -> Json;

/// Appends every referenced node id and parameter name, in traversal order.
auto collect_references(const ArgumentValue& value, std::vector<std::string>& node_ids,
                        std::vector<std::string>& parameter_names) -> void;

}  // namespace pg::engine
