#include "engine/registry.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <mutex>
#include <system_error>

#include "common/logging/log.hpp"

namespace pg::engine {

auto RegistrySnapshot::find(std::string_view id) const -> const ProcessDefinition* {
  if (builtins_) {
    if (auto it = builtins_->find(id); it != builtins_->end()) {
      return it->second.get();
    }
  }
  if (auto it = user_defined_.find(id); it != user_defined_.end()) {
    return it->second.get();
  }
  return nullptr;
}

auto RegistrySnapshot::list() const -> std::vector<std::shared_ptr<const ProcessDefinition>> {
  std::vector<std::shared_ptr<const ProcessDefinition>> definitions;
  if (builtins_) {
    for (const auto& [id, definition] : *builtins_) {
      definitions.push_back(definition);
    }
  }
  for (const auto& [id, definition] : user_defined_) {
    definitions.push_back(definition);
  }
  return definitions;
}

ProcessRegistry::ProcessRegistry() : builtins_(std::make_shared<const DefinitionMap>()) {}

auto ProcessRegistry::register_builtin(ProcessDefinition definition) -> Expected<void> {
  if (definition.kind() != ProcessKind::Builtin) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("process '{}' is not a built-in", definition.id)));
  }
  std::unique_lock lock(mutex_);
  if (frozen_) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("cannot register '{}': built-ins are frozen", definition.id)));
  }
  if (builtins_->contains(definition.id)) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("built-in process already registered: {}", definition.id)));
  }
  // Copy on write so snapshots taken earlier keep their view.
  auto next = std::make_shared<DefinitionMap>(*builtins_);
  auto id = definition.id;
  next->emplace(id, std::make_shared<const ProcessDefinition>(std::move(definition)));
  builtins_ = std::move(next);
  return {};
}

auto ProcessRegistry::register_builtin(const Json& description, InvokeFn invoke) -> Expected<void> {
  auto definition = make_builtin(description, std::move(invoke));
  if (!definition) {
    return tl::unexpected(definition.error());
  }
  return register_builtin(std::move(*definition));
}

auto ProcessRegistry::freeze_builtins() -> void {
  std::unique_lock lock(mutex_);
  frozen_ = true;
}

auto ProcessRegistry::builtins_frozen() const -> bool {
  std::shared_lock lock(mutex_);
  return frozen_;
}

auto ProcessRegistry::put_user_defined(std::string_view owner, const Json& document)
  -> Expected<std::shared_ptr<const ProcessDefinition>> {
  auto definition = parse_process_definition(document, std::string(owner));
  if (!definition) {
    pg::log::warn("rejected user-defined process for owner '{}': {}", owner, definition.error().message);
    return tl::unexpected(definition.error());
  }
  return put_user_defined(owner, std::move(*definition));
}

auto ProcessRegistry::put_user_defined(std::string_view owner, ProcessDefinition definition)
  -> Expected<std::shared_ptr<const ProcessDefinition>> {
  if (definition.kind() != ProcessKind::UserDefined) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("process '{}' is not user-defined", definition.id)));
  }
  auto& body = std::get<UserDefinedProcess>(definition.body);
  body.owner = std::string(owner);

  std::unique_lock lock(mutex_);
  if (builtins_->contains(definition.id)) {
    return tl::unexpected(make_error(
      ErrorKind::InvalidProcessDefinition,
      std::format("user-defined process '{}' collides with a built-in process", definition.id)));
  }
  auto shared = std::make_shared<const ProcessDefinition>(std::move(definition));
  auto& processes = user_defined_[std::string(owner)];
  bool replaced = processes.contains(shared->id);
  processes.insert_or_assign(shared->id, shared);
  lock.unlock();

  pg::log::info("{} user-defined process '{}' for owner '{}'", replaced ? "updated" : "stored", shared->id, owner);
  return shared;
}

auto ProcessRegistry::remove_user_defined(std::string_view owner, std::string_view id) -> bool {
  std::unique_lock lock(mutex_);
  auto owner_it = user_defined_.find(std::string(owner));
  if (owner_it == user_defined_.end()) {
    return false;
  }
  auto it = owner_it->second.find(id);
  if (it == owner_it->second.end()) {
    return false;
  }
  owner_it->second.erase(it);
  if (owner_it->second.empty()) {
    user_defined_.erase(owner_it);
  }
  lock.unlock();
  pg::log::info("removed user-defined process '{}' for owner '{}'", id, owner);
  return true;
}

auto ProcessRegistry::load_file(std::string_view owner, const std::filesystem::path& path)
  -> Expected<std::shared_ptr<const ProcessDefinition>> {
  std::ifstream file(path);
  if (!file) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("failed to open process file: {}", path.string())));
  }
  auto document = Json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return tl::unexpected(make_error(ErrorKind::InvalidProcessDefinition,
                                     std::format("process file is not valid JSON: {}", path.string())));
  }
  return put_user_defined(owner, document);
}

auto ProcessRegistry::load_directory(std::string_view owner, const std::filesystem::path& root)
  -> std::vector<EngineError> {
  std::vector<EngineError> failures;
  std::error_code fs_error;
  if (!std::filesystem::is_directory(root, fs_error)) {
    failures.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("process directory does not exist: {}", root.string())));
    return failures;
  }

  std::vector<std::filesystem::path> paths;
  for (std::filesystem::directory_iterator it(root, fs_error), end; it != end && !fs_error;
       it.increment(fs_error)) {
    std::error_code entry_error;
    if (it->is_regular_file(entry_error) && it->path().extension() == ".json") {
      paths.push_back(it->path());
    }
  }
  if (fs_error) {
    failures.push_back(make_error(ErrorKind::InvalidProcessDefinition,
                                  std::format("scan failed for {}: {}", root.string(), fs_error.message())));
  }
  std::sort(paths.begin(), paths.end());

  for (const auto& path : paths) {
    auto loaded = load_file(owner, path);
    if (!loaded) {
      pg::log::error("failed to load process file {}: {}", path.string(), loaded.error().message);
      auto error = loaded.error();
      error.message = std::format("{}: {}", path.filename().string(), error.message);
      failures.push_back(std::move(error));
    }
  }
  return failures;
}

auto ProcessRegistry::find(std::string_view id, std::string_view owner) const
  -> std::shared_ptr<const ProcessDefinition> {
  std::shared_lock lock(mutex_);
  if (auto it = builtins_->find(id); it != builtins_->end()) {
    return it->second;
  }
  auto owner_it = user_defined_.find(std::string(owner));
  if (owner_it == user_defined_.end()) {
    return nullptr;
  }
  if (auto it = owner_it->second.find(id); it != owner_it->second.end()) {
    return it->second;
  }
  return nullptr;
}

auto ProcessRegistry::list(std::string_view owner) const -> std::vector<std::shared_ptr<const ProcessDefinition>> {
  return snapshot(owner)->list();
}

auto ProcessRegistry::snapshot(std::string_view owner) const -> std::shared_ptr<const RegistrySnapshot> {
  auto snapshot = std::make_shared<RegistrySnapshot>();
  snapshot->owner_ = std::string(owner);
  std::shared_lock lock(mutex_);
  snapshot->builtins_ = builtins_;
  if (auto it = user_defined_.find(snapshot->owner_); it != user_defined_.end()) {
    snapshot->user_defined_ = it->second;
  }
  return snapshot;
}

}  // namespace pg::engine
