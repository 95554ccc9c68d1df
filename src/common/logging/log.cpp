#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <mutex>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_string(log_stderr_level);

namespace pg::log {

namespace {

constexpr std::size_t kMinFileSize = 1024;
constexpr std::size_t kQueueSize = 8192;

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

auto level_from_flag(const std::string& name, spdlog::level::level_enum fallback) -> spdlog::level::level_enum {
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str answers off for names it does not know.
  auto level = spdlog::level::from_str(name == "warning" ? "warn" : name);
  return level == spdlog::level::off ? fallback : level;
}

auto quote(const std::string& value) -> std::string {
  if (!value.empty() && std::none_of(value.begin(), value.end(), [](char c) { return c == ' ' || c == '"'; })) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  const auto file_level = level_from_flag(FLAGS_log_level, spdlog::level::info);
  const auto stderr_level = level_from_flag(FLAGS_log_stderr_level, spdlog::level::off);
  const auto max_size = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)), kMinFileSize);
  const auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));

  std::vector<spdlog::sink_ptr> sinks;
  if (!FLAGS_log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(FLAGS_log_file, max_size, max_files);
    file_sink->set_level(file_level);
    sinks.push_back(std::move(file_sink));
  }
  if (stderr_level != spdlog::level::off) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(stderr_level);
    sinks.push_back(std::move(console_sink));
  }

  spdlog::init_thread_pool(kQueueSize, 1);
  g_logger = std::make_shared<spdlog::async_logger>(
      "pg_engine", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  g_logger->set_level(std::min(file_level, stderr_level));
  g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
  g_logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(g_logger);

  spdlog::info("logger ready: file={} level={} stderr_level={}", FLAGS_log_file, FLAGS_log_level,
               FLAGS_log_stderr_level);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  spdlog::shutdown();
  g_logger.reset();
}

void event(spdlog::level::level_enum level, std::string_view name, const Fields& fields) {
  std::string line{name};
  for (const auto& [key, value] : fields) {
    line += ' ';
    line += key;
    line += '=';
    line += quote(value);
  }
  spdlog::log(level, line);
}

}  // namespace pg::log
