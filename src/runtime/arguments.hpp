#pragma once

#include <string_view>

#include "engine/dsl.hpp"
#include "engine/error.hpp"
#include "engine/types.hpp"
#include "runtime/context.hpp"

namespace pg::engine {

auto resolve_argument(const ArgumentValue& value, const EvaluationContext& context, std::string_view node_id)
  -> Expected<Json>;

/// Produces the concrete argument object for node from the outputs and
/// parameters in context.
auto resolve_arguments(const NodeDef& node, const EvaluationContext& context) -> Expected<Json>;

}  // namespace pg::engine
