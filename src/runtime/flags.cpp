#include <gflags/gflags.h>

#include "runtime/engine.hpp"

DEFINE_int32(eval_threads, 0, "Graph evaluation worker threads (0 = hardware concurrency)");
DEFINE_int32(max_recursion_depth, 16, "Deepest allowed nesting of user-defined process calls");
DEFINE_int32(async_threads, 2, "Threads serving asynchronous evaluation requests");

namespace pg::engine {

auto engine_config_from_flags() -> EngineConfig {
  EngineConfig config;
  config.executor.worker_threads = FLAGS_eval_threads;
  config.executor.max_recursion_depth = FLAGS_max_recursion_depth;
  config.async_threads = FLAGS_async_threads > 0 ? FLAGS_async_threads : 1;
  return config;
}

}  // namespace pg::engine
