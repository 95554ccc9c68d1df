#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

#include <stdexec/execution.hpp>

#include "test_support.hpp"

using pg::test::ErrorKind;
using pg::test::Json;

namespace {

auto evi_wrapper() -> Json {
  auto definition = pg::test::evi_process_definition();
  definition.erase("id");
  definition["parameters"][2]["default"] = 0.1;
  return definition;
}

}  // namespace

TEST(Engine, EvaluatesBareGraph) {
  auto engine = pg::test::make_engine();
  ASSERT_NE(engine, nullptr);
  auto result = engine->evaluate(Json::parse(pg::test::kEviGraph), pg::test::evi_parameters());
  ASSERT_TRUE(result) << result.error().describe();
  EXPECT_NEAR(result->get<double>(), pg::test::kEviExpected, 1e-9);
}

TEST(Engine, MissingExternalParameterIsUnbound) {
  auto engine = pg::test::make_engine();
  auto result = engine->evaluate(Json::parse(pg::test::kEviGraph), Json{{"nir", 0.5}, {"blue", 0.1}});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::UnboundParameter);
  EXPECT_EQ(result.error().parameter, "red");
}

TEST(Engine, EvaluatesProcessWrapperWithDefaults) {
  auto engine = pg::test::make_engine();
  auto result = engine->evaluate(evi_wrapper(), Json{{"nir", 0.5}, {"red", 0.2}});
  ASSERT_TRUE(result) << result.error().describe();
  EXPECT_NEAR(result->get<double>(), pg::test::kEviExpected, 1e-9);

  auto missing = engine->evaluate(evi_wrapper(), Json{{"nir", 0.5}});
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, ErrorKind::SchemaViolation);
  EXPECT_EQ(missing.error().parameter, "red");

  auto invalid = engine->evaluate(evi_wrapper(), Json{{"nir", "bright"}, {"red", 0.2}});
  ASSERT_FALSE(invalid);
  EXPECT_EQ(invalid.error().kind, ErrorKind::SchemaViolation);
  EXPECT_EQ(invalid.error().side, pg::engine::SchemaSide::Argument);
}

TEST(Engine, ValidateAccumulatesStructuralIssues) {
  auto engine = pg::test::make_engine();
  auto issues = engine->validate(Json::parse(R"JSON(
  {
    "a": { "process_id": "absolute", "arguments": { "x": { "from_node": "ghost" } } },
    "b": { "process_id": "no_such_process", "arguments": {} },
    "c": { "process_id": "absolute", "arguments": { "x": { "from_node": "c" } } },
    "d": { "arguments": {} }
  }
  )JSON"));
  EXPECT_TRUE(pg::test::has_issue(issues, ErrorKind::AmbiguousOrMissingResult));
  EXPECT_TRUE(pg::test::has_issue(issues, ErrorKind::DanglingReference));
  EXPECT_TRUE(pg::test::has_issue(issues, ErrorKind::UnknownProcess));
  EXPECT_TRUE(pg::test::has_issue(issues, ErrorKind::CyclicDependency));
  EXPECT_TRUE(pg::test::has_issue(issues, ErrorKind::MalformedGraph));
  EXPECT_EQ(issues.size(), 5u);

  EXPECT_TRUE(engine->validate(Json::parse(pg::test::kEviGraph)).empty());
}

TEST(Engine, EvaluateReturnsEveryStructuralIssue) {
  auto engine = pg::test::make_engine();
  auto result = engine->evaluate(Json::parse(R"JSON(
  {
    "a": { "process_id": "absolute", "arguments": { "x": { "from_node": "b" } }, "result": true },
    "b": { "process_id": "absolute", "arguments": { "x": { "from_node": "a" } }, "result": true }
  }
  )JSON"));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::AmbiguousOrMissingResult);
  EXPECT_EQ(result.error().issues.size(), 2u);
  EXPECT_TRUE(pg::test::has_issue(result.error().issues, ErrorKind::CyclicDependency));
}

TEST(Engine, ValidatesDeclaredParameterReferences) {
  auto engine = pg::test::make_engine();
  auto wrapper = evi_wrapper();
  wrapper["parameters"].erase(1);
  auto issues = engine->validate(wrapper);
  ASSERT_EQ(issues.size(), 2u);
  for (const auto& issue : issues) {
    EXPECT_EQ(issue.kind, ErrorKind::DanglingReference);
    EXPECT_EQ(issue.parameter, "red");
  }
}

TEST(Engine, HandlesText) {
  auto engine = pg::test::make_engine();
  auto result = engine->evaluate_text(pg::test::kEviGraph, pg::test::evi_parameters());
  ASSERT_TRUE(result);

  auto broken = engine->evaluate_text("{ \"a\": ", Json::object());
  ASSERT_FALSE(broken);
  EXPECT_EQ(broken.error().kind, ErrorKind::MalformedGraph);

  auto issues = engine->validate_text("[1, 2");
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].kind, ErrorKind::MalformedGraph);
}

TEST(Engine, UserDefinedProcessesAreScopedToOwner) {
  auto engine = pg::test::make_engine();
  ASSERT_TRUE(engine->put_user_defined("alice", pg::test::evi_process_definition()));

  auto document = Json::parse(R"JSON(
  { "v": { "process_id": "evi", "arguments": { "nir": 0.5, "red": 0.2, "blue": 0.1 }, "result": true } }
  )JSON");
  auto result = engine->evaluate(document, Json::object(), "alice");
  ASSERT_TRUE(result) << result.error().describe();
  EXPECT_NEAR(result->get<double>(), pg::test::kEviExpected, 1e-9);

  auto other = engine->evaluate(document, Json::object(), "bob");
  ASSERT_FALSE(other);
  EXPECT_EQ(other.error().kind, ErrorKind::UnknownProcess);

  auto described = engine->describe_process("alice", "evi");
  ASSERT_TRUE(described.has_value());
  EXPECT_EQ((*described)["summary"], "Enhanced vegetation index");
  EXPECT_FALSE(engine->describe_process("bob", "evi").has_value());
  EXPECT_TRUE(engine->describe_process("bob", "add").has_value());

  EXPECT_EQ(engine->list_processes("alice")["processes"].size(), 12u);
  EXPECT_TRUE(engine->remove_user_defined("alice", "evi"));
  EXPECT_EQ(engine->list_processes("alice")["processes"].size(), 11u);
}

TEST(Engine, RecursionLimitComesFromConfig) {
  auto engine = pg::test::make_engine(2, 3);
  ASSERT_TRUE(engine->put_user_defined("alice", pg::test::self_calling_definition("loop")));
  auto result = engine->evaluate(Json::parse(R"JSON(
  { "go": { "process_id": "loop", "arguments": { "x": 0 }, "result": true } }
  )JSON"),
                                 Json::object(), "alice");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::RecursionLimitExceeded);
  EXPECT_EQ(result.error().call_path.size(), 3u);
}

TEST(Engine, BuiltinsAreFrozenAfterCreate) {
  auto engine = pg::test::make_engine();
  EXPECT_TRUE(engine->registry().builtins_frozen());
  auto late = engine->registry().register_process(Json{{"id", "late"}}, [](const Json&) -> Json { return 1; });
  EXPECT_FALSE(late);
}

TEST(Engine, FailingInstallerFailsCreate) {
  auto engine = pg::engine::Engine::create({}, [](pg::engine::ProcessRegistry&) -> pg::engine::Expected<void> {
    return tl::unexpected(pg::engine::make_error(ErrorKind::InvalidProcessDefinition, "nope"));
  });
  ASSERT_FALSE(engine);
  EXPECT_EQ(engine.error().message, "nope");
}

TEST(Engine, EvaluatesAsynchronously) {
  auto engine = pg::test::make_engine();
  auto completed = stdexec::sync_wait(engine->evaluate_async(Json::parse(pg::test::kEviGraph),
                                                             pg::test::evi_parameters()));
  ASSERT_TRUE(completed.has_value());
  auto& [result] = *completed;
  ASSERT_TRUE(result) << result.error().describe();
  EXPECT_NEAR(result->get<double>(), pg::test::kEviExpected, 1e-9);
}

TEST(Engine, ConcurrentEvaluationsAreIndependent) {
  auto engine = pg::test::make_engine(4);
  std::vector<std::thread> callers;
  std::atomic<int> failures{0};
  for (int i = 0; i < 8; ++i) {
    callers.emplace_back([&engine, &failures, i]() {
      auto nir = 0.5 + 0.01 * i;
      auto parameters = Json{{"nir", nir}, {"red", 0.2}, {"blue", 0.1}};
      auto result = engine->evaluate(Json::parse(pg::test::kEviGraph), parameters);
      auto expected = 2.5 * (nir - 0.2) / (1 + nir + 6 * 0.2 - 7.5 * 0.1);
      if (!result || std::abs(result->get<double>() - expected) > 1e-9) {
        failures.fetch_add(1);
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  EXPECT_EQ(failures.load(), 0);
}

TEST(Engine, ErrorsSerializeToJson) {
  auto engine = pg::test::make_engine();
  auto result = engine->evaluate(Json::parse(pg::test::kEviGraph), Json{{"nir", 0.5}, {"blue", 0.1}});
  ASSERT_FALSE(result);
  auto json = pg::engine::to_json(result.error());
  EXPECT_EQ(json["code"], "UnboundParameter");
  EXPECT_EQ(json["parameter"], "red");
  EXPECT_TRUE(json.contains("node_id"));
}

TEST(Engine, RejectsDeeplyNestedInputs) {
  auto engine = pg::test::make_engine();
  std::string deep(20000, '[');
  deep += std::string(20000, ']');

  auto document = Json::parse(R"JSON(
  { "a": { "process_id": "constant", "arguments": { "x": 0 }, "result": true } }
  )JSON");
  document["a"]["arguments"]["x"] = Json::parse(deep);
  auto issues = engine->validate(document);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].kind, ErrorKind::MalformedGraph);
  EXPECT_EQ(issues[0].node_id, "a");

  auto parameters = Json{{"nir", Json::parse(deep)}};
  auto result = engine->evaluate(Json::parse(pg::test::kEviGraph), parameters);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind, ErrorKind::SchemaViolation);
}

TEST(Engine, DestructionJoinsRunningAsyncEvaluation) {
  std::atomic<bool> started{false};
  std::atomic<bool> finished{false};
  auto created = pg::engine::Engine::create({}, [&started](pg::engine::ProcessRegistry& registry) {
    auto description = Json{{"id", "slow"}, {"parameters", Json::array()}, {"returns", Json{{"schema", Json::object()}}}};
    return registry.register_process(description, [&started](const Json&) -> Json {
      started.store(true);
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      return 42;
    });
  });
  ASSERT_TRUE(created);
  auto engine = std::move(*created);

  auto document = Json::parse(R"JSON({ "s": { "process_id": "slow", "arguments": {}, "result": true } })JSON");
  stdexec::start_detached(engine->evaluate_async(document)
                          | stdexec::then([&finished](pg::engine::Expected<Json> result) {
                              finished.store(result.has_value() && *result == Json(42));
                            }));
  while (!started.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  engine.reset();
  EXPECT_TRUE(finished.load());
}
