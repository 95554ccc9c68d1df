#pragma once

#include "engine/error.hpp"
#include "engine/registry.hpp"

namespace pg::process {

/// Registers the arithmetic and array processes: absolute, add, subtract,
/// multiply, divide, sum, product, normalized_difference, clip,
/// array_element and constant.
auto register_math_processes(pg::engine::ProcessRegistry& registry) -> pg::engine::Expected<void>;

}  // namespace pg::process
