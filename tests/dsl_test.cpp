#include "test_support.hpp"

using pg::engine::ArgumentKind;
using pg::engine::classify_argument;
using pg::engine::parse_graph_document;
using pg::engine::parse_process_graph;
using pg::test::ErrorKind;
using pg::test::Json;

namespace {

auto find_node(const pg::engine::ProcessGraph& graph, std::string_view id) -> const pg::engine::NodeDef* {
  for (const auto& node : graph.nodes) {
    if (node.id == id) {
      return &node;
    }
  }
  return nullptr;
}

/// A single-node graph whose argument "x" is levels arrays deep.
auto nested_argument_graph(std::size_t levels) -> Json {
  std::string text = R"({"a": {"process_id": "constant", "result": true, "arguments": {"x": )";
  text.append(levels, '[');
  text += "1";
  text.append(levels, ']');
  text += "}}}";
  return Json::parse(text);
}

}  // namespace

TEST(Dsl, ParsesEviGraph) {
  std::vector<pg::engine::EngineError> issues;
  auto graph = parse_process_graph(Json::parse(pg::test::kEviGraph), issues);
  ASSERT_TRUE(issues.empty());
  ASSERT_EQ(graph.nodes.size(), 6u);
  ASSERT_GE(graph.result_index, 0);
  EXPECT_EQ(graph.nodes[static_cast<std::size_t>(graph.result_index)].id, "p3");

  for (const char* id : {"p1", "p2", "p3"}) {
    ASSERT_NE(find_node(graph, id), nullptr);
    EXPECT_EQ(find_node(graph, id)->process_id, "product");
    EXPECT_EQ(find_node(graph, id)->arguments[0].name, "data");
  }

  const auto* sum = find_node(graph, "sum");
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->process_id, "sum");
  ASSERT_EQ(sum->arguments.size(), 1u);
  const auto& data = sum->arguments[0].value;
  ASSERT_EQ(data.kind, ArgumentKind::Array);
  ASSERT_EQ(data.items.size(), 4u);
  EXPECT_EQ(data.items[0].kind, ArgumentKind::Literal);
  EXPECT_EQ(data.items[1].kind, ArgumentKind::ParameterReference);
  EXPECT_EQ(data.items[1].target, "nir");
  EXPECT_EQ(data.items[2].kind, ArgumentKind::NodeReference);
  EXPECT_EQ(data.items[2].target, "p1");
}

TEST(Dsl, ClassifiesArgumentsByShape) {
  std::vector<pg::engine::EngineError> issues;
  auto node_ref = classify_argument(Json{{"from_node", "a"}}, "n", issues);
  EXPECT_EQ(node_ref.kind, ArgumentKind::NodeReference);
  EXPECT_EQ(node_ref.target, "a");

  auto parameter_ref = classify_argument(Json{{"from_parameter", "x"}}, "n", issues);
  EXPECT_EQ(parameter_ref.kind, ArgumentKind::ParameterReference);
  EXPECT_EQ(parameter_ref.target, "x");

  auto literal = classify_argument(Json{{"a", 1}, {"b", Json::array({1, 2})}}, "n", issues);
  EXPECT_EQ(literal.kind, ArgumentKind::Literal);
  EXPECT_EQ(literal.literal, (Json{{"a", 1}, {"b", Json::array({1, 2})}}));

  auto nested = classify_argument(Json{{"bands", Json::array({Json{{"from_node", "a"}}, "B08"})}}, "n", issues);
  ASSERT_EQ(nested.kind, ArgumentKind::Object);
  ASSERT_EQ(nested.keys.size(), 1u);
  EXPECT_EQ(nested.keys[0], "bands");
  EXPECT_EQ(nested.items[0].kind, ArgumentKind::Array);
  EXPECT_TRUE(issues.empty());
}

TEST(Dsl, CallbackArgumentsStayOpaque) {
  std::vector<pg::engine::EngineError> issues;
  auto callback = Json{{"process_graph", Json{{"inner", Json{{"process_id", "absolute"},
                                                              {"arguments", Json{{"x", Json{{"from_node", "outer"}}}}},
                                                              {"result", true}}}}}};
  auto value = classify_argument(callback, "n", issues);
  EXPECT_EQ(value.kind, ArgumentKind::Literal);
  EXPECT_TRUE(issues.empty());
}

TEST(Dsl, RejectsNonStringReference) {
  std::vector<pg::engine::EngineError> issues;
  auto value = classify_argument(Json{{"from_node", 3}}, "n", issues);
  EXPECT_EQ(value.kind, ArgumentKind::Literal);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].kind, ErrorKind::MalformedGraph);
  EXPECT_EQ(issues[0].node_id, "n");
}

TEST(Dsl, ReportsEveryMalformedNode) {
  auto document = Json::parse(R"JSON(
  {
    "a": { "arguments": {} },
    "b": { "process_id": "absolute", "arguments": [] },
    "c": { "process_id": "absolute", "arguments": { "x": 1 }, "result": "yes" },
    "d": { "process_id": "absolute", "arguments": { "x": 1 }, "result": true }
  }
  )JSON");
  std::vector<pg::engine::EngineError> issues;
  auto graph = parse_process_graph(document, issues);
  EXPECT_EQ(pg::test::count_issues(issues, ErrorKind::MalformedGraph), 3);
  ASSERT_EQ(graph.nodes.size(), 4u);
  EXPECT_FALSE(find_node(graph, "a")->well_formed);
  EXPECT_FALSE(find_node(graph, "b")->well_formed);
  EXPECT_FALSE(find_node(graph, "c")->well_formed);
  EXPECT_TRUE(find_node(graph, "d")->well_formed);
}

TEST(Dsl, RequiresExactlyOneResultNode) {
  std::vector<pg::engine::EngineError> none_issues;
  parse_process_graph(Json::parse(R"JSON({ "a": { "process_id": "absolute", "arguments": { "x": 1 } } })JSON"),
                      none_issues);
  ASSERT_EQ(none_issues.size(), 1u);
  EXPECT_EQ(none_issues[0].kind, ErrorKind::AmbiguousOrMissingResult);

  std::vector<pg::engine::EngineError> many_issues;
  auto graph = parse_process_graph(Json::parse(R"JSON(
  {
    "a": { "process_id": "absolute", "arguments": { "x": 1 }, "result": true },
    "b": { "process_id": "absolute", "arguments": { "x": 2 }, "result": true }
  }
  )JSON"),
                                   many_issues);
  ASSERT_EQ(many_issues.size(), 1u);
  EXPECT_EQ(many_issues[0].kind, ErrorKind::AmbiguousOrMissingResult);
  EXPECT_EQ(many_issues[0].nodes, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(graph.result_index, -1);
}

TEST(Dsl, RejectsNonObjectGraph) {
  auto graph = parse_process_graph(Json::array({1, 2}));
  ASSERT_FALSE(graph);
  EXPECT_EQ(graph.error().kind, ErrorKind::MalformedGraph);
}

TEST(Dsl, ParsesProcessWrapper) {
  auto document = Json{
    {"process_graph", Json::parse(pg::test::kEviGraph)},
    {"parameters", Json::parse(R"JSON([
      { "name": "nir", "schema": { "type": "number" } },
      { "name": "red", "schema": { "type": "number" } },
      { "name": "blue", "schema": { "type": "number" }, "default": 0.1 }
    ])JSON")},
    {"returns", Json{{"schema", Json{{"type", "number"}}}}},
  };
  ASSERT_TRUE(pg::engine::is_process_wrapper(document));
  EXPECT_FALSE(pg::engine::is_process_wrapper(Json::parse(pg::test::kEviGraph)));

  std::vector<pg::engine::EngineError> issues;
  auto parsed = parse_graph_document(document, issues);
  ASSERT_TRUE(issues.empty());
  EXPECT_TRUE(parsed.declares_parameters);
  ASSERT_EQ(parsed.parameters.size(), 3u);
  EXPECT_FALSE(parsed.parameters[0].optional);
  EXPECT_TRUE(parsed.parameters[2].has_default);
  EXPECT_TRUE(parsed.parameters[2].optional);
  EXPECT_EQ(parsed.parameters[2].default_value, Json(0.1));
  ASSERT_TRUE(parsed.returns.has_value());
  EXPECT_EQ(parsed.graph.nodes.size(), 6u);
}

TEST(Dsl, NodeNamedProcessGraphIsNotAWrapper) {
  auto document = Json::parse(R"JSON(
  { "process_graph": { "process_id": "absolute", "arguments": { "x": -1 }, "result": true } }
  )JSON");
  EXPECT_FALSE(pg::engine::is_process_wrapper(document));
  std::vector<pg::engine::EngineError> issues;
  auto parsed = parse_graph_document(document, issues);
  EXPECT_TRUE(issues.empty());
  ASSERT_EQ(parsed.graph.nodes.size(), 1u);
  EXPECT_EQ(parsed.graph.nodes[0].id, "process_graph");
}

TEST(Dsl, RejectsBadParameterDeclarations) {
  auto document = Json{
    {"process_graph", Json::parse(pg::test::kEviGraph)},
    {"parameters", Json::parse(R"JSON([ { "schema": {} }, { "name": "x", "optional": 1 } ])JSON")},
  };
  std::vector<pg::engine::EngineError> issues;
  parse_graph_document(document, issues);
  EXPECT_EQ(pg::test::count_issues(issues, ErrorKind::MalformedGraph), 2);
}

TEST(Dsl, RejectsArgumentsNestedTooDeeply) {
  std::vector<pg::engine::EngineError> issues;
  auto graph = parse_process_graph(nested_argument_graph(20000), issues);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].kind, ErrorKind::MalformedGraph);
  EXPECT_EQ(issues[0].node_id, "a");
  ASSERT_EQ(graph.nodes.size(), 1u);
  EXPECT_FALSE(graph.nodes[0].well_formed);
  EXPECT_TRUE(graph.nodes[0].arguments.empty());

  std::vector<pg::engine::EngineError> direct;
  auto classified = classify_argument(nested_argument_graph(20000)["a"]["arguments"]["x"], "a", direct);
  ASSERT_EQ(direct.size(), 1u);
  EXPECT_EQ(direct[0].kind, ErrorKind::MalformedGraph);
  EXPECT_EQ(classified.kind, ArgumentKind::Literal);
  EXPECT_TRUE(classified.literal.is_null());
}

TEST(Dsl, AcceptsNestingUpToTheLimit) {
  std::vector<pg::engine::EngineError> issues;
  auto graph = parse_process_graph(nested_argument_graph(pg::engine::kMaxNestingDepth), issues);
  EXPECT_TRUE(issues.empty());
  EXPECT_TRUE(pg::engine::nesting_exceeds(nested_argument_graph(pg::engine::kMaxNestingDepth + 1)["a"]["arguments"]["x"],
                                          pg::engine::kMaxNestingDepth));
  EXPECT_FALSE(pg::engine::nesting_exceeds(Json{{"west", 1}, {"bands", Json::array({"B04"})}}, 2));
  EXPECT_TRUE(pg::engine::nesting_exceeds(Json{{"west", 1}, {"bands", Json::array({"B04"})}}, 1));
}

TEST(Dsl, RejectsDeeplyNestedParameterDeclarations) {
  std::string schema(5000, '[');
  schema += std::string(5000, ']');
  auto declaration = Json::array({Json{{"name", "x"}, {"schema", Json::parse(schema)}}});
  std::vector<pg::engine::EngineError> issues;
  auto parameters = pg::engine::parse_parameter_specs(declaration, "demo", issues);
  EXPECT_TRUE(parameters.empty());
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].kind, ErrorKind::InvalidProcessDefinition);
}
