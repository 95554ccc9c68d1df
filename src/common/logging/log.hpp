#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pg::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// key=value pairs appended to an event line, in insertion order.
using Fields = std::vector<std::pair<std::string, std::string>>;

/// Installs the engine logger from the --log_* flags. Safe to call more than
/// once and from several threads; only the first call configures sinks.
void init();

/// Flushes pending records and drops the logger so init() can run again.
void shutdown();

/// Logs `name key=value ...` at level. Values containing spaces are quoted.
void event(spdlog::level::level_enum level, std::string_view name, const Fields& fields);

}  // namespace pg::log
