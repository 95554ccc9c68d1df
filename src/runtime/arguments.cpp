#include "runtime/arguments.hpp"

#include <format>
#include <string>

namespace pg::engine {

auto resolve_argument(const ArgumentValue& value, const EvaluationContext& context, std::string_view node_id)
  -> Expected<Json> {
  switch (value.kind) {
    case ArgumentKind::Literal:
      return value.literal;

    case ArgumentKind::NodeReference: {
      const auto* output = context.output(value.target);
      if (!output) {
        auto error = make_error(ErrorKind::DanglingReference,
                                std::format("output of node '{}' is not available to node '{}'", value.target,
                                            node_id),
                                std::string(node_id));
        error.nodes.push_back(value.target);
        return tl::unexpected(std::move(error));
      }
      return *output;
    }

    case ArgumentKind::ParameterReference: {
      const auto* bound = context.parameter(value.target);
      if (!bound) {
        auto error = make_error(ErrorKind::UnboundParameter,
                                std::format("parameter '{}' used by node '{}' is not bound and has no default",
                                            value.target, node_id),
                                std::string(node_id));
        error.parameter = value.target;
        return tl::unexpected(std::move(error));
      }
      return *bound;
    }

    case ArgumentKind::Array: {
      auto array = Json::array();
      for (const auto& item : value.items) {
        auto resolved = resolve_argument(item, context, node_id);
        if (!resolved) {
          return tl::unexpected(resolved.error());
        }
        array.push_back(std::move(*resolved));
      }
      return array;
    }

    case ArgumentKind::Object: {
      auto object = Json::object();
      for (std::size_t i = 0; i < value.items.size(); ++i) {
        auto resolved = resolve_argument(value.items[i], context, node_id);
        if (!resolved) {
          return tl::unexpected(resolved.error());
        }
        object[value.keys[i]] = std::move(*resolved);
      }
      return object;
    }
  }
  return tl::unexpected(make_error(ErrorKind::MalformedGraph, "unknown argument kind", std::string(node_id)));
}

auto resolve_arguments(const NodeDef& node, const EvaluationContext& context) -> Expected<Json> {
  auto arguments = Json::object();
  for (const auto& entry : node.arguments) {
    auto resolved = resolve_argument(entry.value, context, node.id);
    if (!resolved) {
      return tl::unexpected(resolved.error());
    }
    arguments[entry.name] = std::move(*resolved);
  }
  return arguments;
}

}  // namespace pg::engine
