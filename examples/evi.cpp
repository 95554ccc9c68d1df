#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "process/math_processes.hpp"
#include "runtime/engine.hpp"

DEFINE_string(graph, "", "Path to a process graph or process JSON document; the built-in EVI graph when empty");
DEFINE_string(parameters, R"({"nir": 0.5, "red": 0.2, "blue": 0.1})", "JSON object of external parameters");
DEFINE_string(processes, "", "Directory of user-defined process JSON files to load");
DEFINE_string(owner, "demo", "Owner of the loaded user-defined processes");
DEFINE_bool(validate_only, false, "Report structural issues without evaluating");

namespace {

const char* kEviGraph = R"JSON(
{
  "sub": { "process_id": "subtract", "arguments": { "x": { "from_parameter": "nir" }, "y": { "from_parameter": "red" } } },
  "p1": { "process_id": "product", "arguments": { "data": [6, { "from_parameter": "red" }] } },
  "p2": { "process_id": "product", "arguments": { "data": [-7.5, { "from_parameter": "blue" }] } },
  "sum": { "process_id": "sum", "arguments": { "data": [1, { "from_parameter": "nir" }, { "from_node": "p1" }, { "from_node": "p2" }] } },
  "div": { "process_id": "divide", "arguments": { "x": { "from_node": "sub" }, "y": { "from_node": "sum" } } },
  "p3": { "process_id": "product", "arguments": { "data": [2.5, { "from_node": "div" }] }, "result": true }
}
)JSON";

auto read_text(const std::string& path, std::string& out) -> bool {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Evaluate an openEO process graph");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  auto engine = pg::engine::Engine::create(pg::engine::engine_config_from_flags(),
                                           [](pg::engine::ProcessRegistry& registry) {
                                             return pg::process::register_math_processes(registry);
                                           });
  if (!engine) {
    std::cerr << std::format("failed to start engine: {}\n", engine.error().describe());
    return 1;
  }

  if (!FLAGS_processes.empty()) {
    for (const auto& failure : (*engine)->registry().load_directory(FLAGS_owner, FLAGS_processes)) {
      std::cerr << std::format("skipped process: {}\n", failure.describe());
    }
  }

  std::string text = kEviGraph;
  if (!FLAGS_graph.empty() && !read_text(FLAGS_graph, text)) {
    std::cerr << std::format("cannot read {}\n", FLAGS_graph);
    return 1;
  }

  if (FLAGS_validate_only) {
    auto issues = (*engine)->validate_text(text, FLAGS_owner);
    for (const auto& issue : issues) {
      std::cout << pg::engine::to_json(issue).dump() << "\n";
    }
    pg::log::shutdown();
    return issues.empty() ? 0 : 2;
  }

  auto parameters = pg::engine::Json::parse(FLAGS_parameters, nullptr, false);
  if (parameters.is_discarded() || !parameters.is_object()) {
    std::cerr << "--parameters must be a JSON object\n";
    return 1;
  }

  auto result = (*engine)->evaluate_text(text, parameters, FLAGS_owner);
  if (!result) {
    std::cout << pg::engine::to_json(result.error()).dump(2) << "\n";
    pg::log::shutdown();
    return 2;
  }
  std::cout << result->dump(2) << "\n";
  pg::log::shutdown();
  return 0;
}
