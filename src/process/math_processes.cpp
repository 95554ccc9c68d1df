#include "process/math_processes.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include "engine/types.hpp"

namespace pg::process {
namespace {

using pg::engine::ErrorKind;
using pg::engine::Expected;
using pg::engine::Json;

auto failure(std::string message) -> tl::unexpected<pg::engine::EngineError> {
  return tl::unexpected(pg::engine::make_error(ErrorKind::ProcessExecutionFailure, std::move(message)));
}

auto number_or_null() -> Json {
  return Json{{"type", Json::array({"number", "null"})}};
}

auto number_array() -> Json {
  return Json{{"type", "array"}, {"items", number_or_null()}};
}

auto parameter(const char* name, const char* description, Json schema) -> Json {
  return Json{{"name", name}, {"description", description}, {"schema", std::move(schema)}};
}

auto optional_parameter(const char* name, const char* description, Json schema, Json fallback) -> Json {
  auto spec = parameter(name, description, std::move(schema));
  spec["optional"] = true;
  spec["default"] = std::move(fallback);
  return spec;
}

auto describe(const char* id, const char* summary, const char* category, Json parameters, Json returns) -> Json {
  return Json{
    {"id", id},
    {"summary", summary},
    {"categories", Json::array({category})},
    {"parameters", std::move(parameters)},
    {"returns", Json{{"description", "The computed value."}, {"schema", std::move(returns)}}},
  };
}

auto binary_description(const char* id, const char* summary) -> Json {
  return describe(id, summary, "math",
                  Json::array({parameter("x", "The first operand.", number_or_null()),
                               parameter("y", "The second operand.", number_or_null())}),
                  number_or_null());
}

auto ignore_nodata_parameter() -> Json {
  return optional_parameter("ignore_nodata", "Skip null values instead of returning null.",
                            Json{{"type", "boolean"}}, true);
}

/// Applies op to x and y; null in either operand yields null.
template <typename Op>
auto binary(Op op) {
  return [op](const Json& arguments) -> Expected<Json> {
    const auto& x = arguments.at("x");
    const auto& y = arguments.at("y");
    if (x.is_null() || y.is_null()) {
      return Json(nullptr);
    }
    return op(x.get<double>(), y.get<double>());
  };
}

/// Folds data with op starting from init. Without ignore_nodata a single null
/// makes the result null; an array with no numbers yields null.
template <typename Op>
auto reduce(double init, Op op) {
  return [init, op](const Json& arguments) -> Json {
    bool ignore_nodata = arguments.value("ignore_nodata", true);
    double accumulated = init;
    bool any = false;
    for (const auto& value : arguments.at("data")) {
      if (value.is_null()) {
        if (!ignore_nodata) {
          return nullptr;
        }
        continue;
      }
      accumulated = op(accumulated, value.get<double>());
      any = true;
    }
    if (!any) {
      return nullptr;
    }
    return accumulated;
  };
}

}  // namespace

auto register_math_processes(pg::engine::ProcessRegistry& registry) -> Expected<void> {
  Expected<void> status;
  auto add_process = [&](const Json& description, auto fn) {
    if (status) {
      status = registry.register_process(description, std::move(fn));
    }
  };

  add_process(describe("absolute", "Absolute value", "math",
                       Json::array({parameter("x", "A number.", number_or_null())}), number_or_null()),
              [](const Json& arguments) -> Json {
                const auto& x = arguments.at("x");
                if (x.is_null()) {
                  return nullptr;
                }
                return std::fabs(x.get<double>());
              });

  add_process(binary_description("add", "Addition of two numbers"),
              binary([](double x, double y) -> Expected<Json> { return x + y; }));
  add_process(binary_description("subtract", "Subtraction of two numbers"),
              binary([](double x, double y) -> Expected<Json> { return x - y; }));
  add_process(binary_description("multiply", "Multiplication of two numbers"),
              binary([](double x, double y) -> Expected<Json> { return x * y; }));
  add_process(binary_description("divide", "Division of two numbers"),
              binary([](double x, double y) -> Expected<Json> {
                if (y == 0.0) {
                  return failure(std::format("division by zero ({} / {})", x, y));
                }
                return x / y;
              }));

  add_process(describe("sum", "Compute the sum by adding up numbers", "reducer",
                       Json::array({parameter("data", "An array of numbers.", number_array()),
                                    ignore_nodata_parameter()}),
                       number_or_null()),
              reduce(0.0, [](double accumulated, double value) { return accumulated + value; }));
  add_process(describe("product", "Compute the product by multiplying numbers", "reducer",
                       Json::array({parameter("data", "An array of numbers.", number_array()),
                                    ignore_nodata_parameter()}),
                       number_or_null()),
              reduce(1.0, [](double accumulated, double value) { return accumulated * value; }));

  add_process(binary_description("normalized_difference", "Normalized difference"),
              binary([](double x, double y) -> Expected<Json> {
                if (x + y == 0.0) {
                  return failure("normalized difference is undefined when x + y is zero");
                }
                return (x - y) / (x + y);
              }));

  add_process(describe("clip", "Clip a value between a minimum and a maximum", "math",
                       Json::array({parameter("x", "A number.", number_or_null()),
                                    parameter("min", "Lower bound.", Json{{"type", "number"}}),
                                    parameter("max", "Upper bound.", Json{{"type", "number"}})}),
                       number_or_null()),
              [](const Json& arguments) -> Expected<Json> {
                const auto& x = arguments.at("x");
                auto low = arguments.at("min").get<double>();
                auto high = arguments.at("max").get<double>();
                if (low > high) {
                  return failure(std::format("clip bounds are inverted: min {} > max {}", low, high));
                }
                if (x.is_null()) {
                  return Json(nullptr);
                }
                auto value = x.get<double>();
                return value < low ? low : (value > high ? high : value);
              });

  add_process(describe("array_element", "Get an element from an array", "arrays",
                       Json::array({parameter("data", "An array.", Json{{"type", "array"}}),
                                    parameter("index", "Zero-based position of the element.",
                                              Json{{"type", "integer"}, {"minimum", 0}}),
                                    optional_parameter("return_nodata",
                                                       "Return null instead of failing for a missing index.",
                                                       Json{{"type", "boolean"}}, false)}),
                       Json::object()),
              [](const Json& arguments) -> Expected<Json> {
                const auto& data = arguments.at("data");
                auto index = arguments.at("index").get<std::int64_t>();
                if (index >= 0 && static_cast<std::size_t>(index) < data.size()) {
                  return data[static_cast<std::size_t>(index)];
                }
                if (arguments.value("return_nodata", false)) {
                  return Json(nullptr);
                }
                return failure(std::format("array index {} is out of bounds for {} elements", index, data.size()));
              });

  add_process(describe("constant", "Define a constant value", "math",
                       Json::array({parameter("x", "The value of the constant.", Json::object())}),
                       Json::object()),
              [](const Json& arguments) -> Json { return arguments.at("x"); });

  return status;
}

}  // namespace pg::process
