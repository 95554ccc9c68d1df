#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/process.hpp"
#include "engine/types.hpp"

namespace pg::engine {

using DefinitionMap = std::map<std::string, std::shared_ptr<const ProcessDefinition>, std::less<>>;

namespace detail {

template <typename T>
struct is_expected : std::false_type {};

template <typename T, typename E>
struct is_expected<tl::expected<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool is_expected_v = is_expected<std::remove_cvref_t<T>>::value;

}  // namespace detail

/// Immutable view of the processes visible to one owner, taken at the start
/// of an evaluation. Later registry mutations do not affect it.
class RegistrySnapshot {
 public:
  auto find(std::string_view id) const -> const ProcessDefinition*;
  auto list() const -> std::vector<std::shared_ptr<const ProcessDefinition>>;
  auto owner() const -> const std::string& { return owner_; }

 private:
  friend class ProcessRegistry;

  std::shared_ptr<const DefinitionMap> builtins_;
  DefinitionMap user_defined_;
  std::string owner_;
};

class ProcessRegistry {
 public:
  ProcessRegistry();

  auto register_builtin(ProcessDefinition definition) -> Expected<void>;
  auto register_builtin(const Json& description, InvokeFn invoke) -> Expected<void>;

  /// Registers fn as a built-in. fn takes the bound arguments and returns
  /// either Expected<Json> or anything convertible to Json.
  template <typename Fn>
  auto register_process(const Json& description, Fn fn) -> Expected<void> {
    using Result = std::invoke_result_t<Fn&, const Json&>;
    if constexpr (detail::is_expected_v<Result>) {
      return register_builtin(description, InvokeFn(std::move(fn)));
    } else {
      return register_builtin(description,
                              InvokeFn([fn = std::move(fn)](const Json& arguments) mutable -> Expected<Json> {
                                return Json(fn(arguments));
                              }));
    }
  }

  /// Built-ins are immutable after this call.
  auto freeze_builtins() -> void;
  auto builtins_frozen() const -> bool;

  auto put_user_defined(std::string_view owner, const Json& document)
    -> Expected<std::shared_ptr<const ProcessDefinition>>;
  auto put_user_defined(std::string_view owner, ProcessDefinition definition)
    -> Expected<std::shared_ptr<const ProcessDefinition>>;
  auto remove_user_defined(std::string_view owner, std::string_view id) -> bool;

  auto load_file(std::string_view owner, const std::filesystem::path& path)
    -> Expected<std::shared_ptr<const ProcessDefinition>>;
  /// Loads every *.json file under root; returns one error per failed file.
  auto load_directory(std::string_view owner, const std::filesystem::path& root) -> std::vector<EngineError>;

  auto find(std::string_view id, std::string_view owner = {}) const -> std::shared_ptr<const ProcessDefinition>;
  auto list(std::string_view owner = {}) const -> std::vector<std::shared_ptr<const ProcessDefinition>>;
  auto snapshot(std::string_view owner = {}) const -> std::shared_ptr<const RegistrySnapshot>;

 private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const DefinitionMap> builtins_;
  bool frozen_ = false;
  std::unordered_map<std::string, DefinitionMap> user_defined_;
};

}  // namespace pg::engine
