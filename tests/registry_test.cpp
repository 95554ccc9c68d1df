#include <filesystem>
#include <fstream>

#include "test_support.hpp"

using pg::engine::ProcessKind;
using pg::engine::ProcessRegistry;
using pg::test::ErrorKind;
using pg::test::Json;

namespace {

auto write_file(const std::filesystem::path& path, const std::string& content) -> void {
  std::ofstream file(path, std::ios::trunc);
  file << content;
}

class TempDirectory {
 public:
  explicit TempDirectory(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  auto path() const -> const std::filesystem::path& { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace

TEST(Registry, RegistersMathProcesses) {
  auto registry = pg::test::make_registry();
  for (const char* id : {"absolute", "add", "subtract", "multiply", "divide", "sum", "product",
                         "normalized_difference", "clip", "array_element", "constant"}) {
    auto definition = registry->find(id);
    ASSERT_NE(definition, nullptr) << id;
    EXPECT_EQ(definition->kind(), ProcessKind::Builtin);
  }
  EXPECT_EQ(registry->list().size(), 11u);
  EXPECT_EQ(registry->find("ndvi"), nullptr);
}

TEST(Registry, RejectsDuplicateAndLateBuiltins) {
  ProcessRegistry registry;
  auto description = Json{{"id", "one"}, {"parameters", Json::array()}, {"returns", Json{{"schema", Json::object()}}}};
  ASSERT_TRUE(registry.register_process(description, [](const Json&) -> Json { return 1; }));
  auto duplicate = registry.register_process(description, [](const Json&) -> Json { return 2; });
  ASSERT_FALSE(duplicate);
  EXPECT_EQ(duplicate.error().kind, ErrorKind::InvalidProcessDefinition);

  registry.freeze_builtins();
  EXPECT_TRUE(registry.builtins_frozen());
  description["id"] = "two";
  EXPECT_FALSE(registry.register_process(description, [](const Json&) -> Json { return 2; }));
}

TEST(Registry, RejectsBuiltinWithoutId) {
  ProcessRegistry registry;
  auto registered = registry.register_process(Json{{"summary", "nameless"}}, [](const Json&) -> Json { return 0; });
  ASSERT_FALSE(registered);
  EXPECT_EQ(registered.error().kind, ErrorKind::InvalidProcessDefinition);
}

TEST(Registry, StoresUserDefinedProcessesPerOwner) {
  auto registry = pg::test::make_registry();
  auto stored = registry->put_user_defined("alice", pg::test::evi_process_definition());
  ASSERT_TRUE(stored) << stored.error().describe();
  EXPECT_EQ((*stored)->kind(), ProcessKind::UserDefined);
  EXPECT_EQ((*stored)->parameters.size(), 3u);

  EXPECT_NE(registry->find("evi", "alice"), nullptr);
  EXPECT_EQ(registry->find("evi", "bob"), nullptr);
  EXPECT_EQ(registry->list("alice").size(), 12u);
  EXPECT_EQ(registry->list("bob").size(), 11u);

  auto description = pg::engine::to_json(**stored);
  EXPECT_EQ(description["id"], "evi");
  EXPECT_EQ(description["process_graph"], Json::parse(pg::test::kEviGraph));
  EXPECT_EQ(description["parameters"].size(), 3u);

  EXPECT_TRUE(registry->remove_user_defined("alice", "evi"));
  EXPECT_FALSE(registry->remove_user_defined("alice", "evi"));
  EXPECT_EQ(registry->find("evi", "alice"), nullptr);
}

TEST(Registry, RejectsInvalidUserDefinedProcesses) {
  auto registry = pg::test::make_registry();

  auto collides = pg::test::evi_process_definition();
  collides["id"] = "add";
  auto collision = registry->put_user_defined("alice", collides);
  ASSERT_FALSE(collision);
  EXPECT_EQ(collision.error().kind, ErrorKind::InvalidProcessDefinition);

  auto no_graph = pg::test::evi_process_definition();
  no_graph.erase("process_graph");
  EXPECT_FALSE(registry->put_user_defined("alice", no_graph));

  auto undeclared = pg::test::evi_process_definition();
  undeclared["parameters"].erase(2);
  auto dangling = registry->put_user_defined("alice", undeclared);
  ASSERT_FALSE(dangling);
  EXPECT_TRUE(pg::test::has_issue(dangling.error().issues, ErrorKind::DanglingReference));

  auto cyclic = pg::test::evi_process_definition();
  cyclic["process_graph"]["sub"]["arguments"]["x"] = Json{{"from_node", "p3"}};
  auto cycle = registry->put_user_defined("alice", cyclic);
  ASSERT_FALSE(cycle);
  EXPECT_TRUE(pg::test::has_issue(cycle.error().issues, ErrorKind::CyclicDependency));

  EXPECT_EQ(registry->list("alice").size(), 11u);
}

TEST(Registry, SnapshotsIgnoreLaterChanges) {
  auto registry = pg::test::make_registry();
  ASSERT_TRUE(registry->put_user_defined("alice", pg::test::evi_process_definition()));
  auto before = registry->snapshot("alice");

  ASSERT_TRUE(registry->remove_user_defined("alice", "evi"));
  ASSERT_TRUE(registry->put_user_defined("alice", pg::test::self_calling_definition("loop")));

  EXPECT_NE(before->find("evi"), nullptr);
  EXPECT_EQ(before->find("loop"), nullptr);
  EXPECT_NE(before->find("add"), nullptr);
  EXPECT_EQ(before->owner(), "alice");

  auto after = registry->snapshot("alice");
  EXPECT_EQ(after->find("evi"), nullptr);
  EXPECT_NE(after->find("loop"), nullptr);
}

TEST(Registry, ReplacesUserDefinedProcessWithSameId) {
  auto registry = pg::test::make_registry();
  ASSERT_TRUE(registry->put_user_defined("alice", pg::test::evi_process_definition()));
  auto updated = pg::test::evi_process_definition();
  updated["summary"] = "EVI v2";
  ASSERT_TRUE(registry->put_user_defined("alice", updated));
  EXPECT_EQ(registry->find("evi", "alice")->summary, "EVI v2");
  EXPECT_EQ(registry->list("alice").size(), 12u);
}

TEST(Registry, LoadsProcessDirectory) {
  TempDirectory directory("pg_engine_registry");
  write_file(directory.path() / "evi.json", pg::test::evi_process_definition().dump(2));
  write_file(directory.path() / "loop.json", pg::test::self_calling_definition("loop").dump());
  write_file(directory.path() / "broken.json", "{ not json");
  write_file(directory.path() / "notes.txt", "ignored");

  auto registry = pg::test::make_registry();
  auto failures = registry->load_directory("alice", directory.path());
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_NE(failures[0].message.find("broken.json"), std::string::npos);
  EXPECT_NE(registry->find("evi", "alice"), nullptr);
  EXPECT_NE(registry->find("loop", "alice"), nullptr);

  auto missing = registry->load_directory("alice", directory.path() / "nope");
  EXPECT_EQ(missing.size(), 1u);
}
