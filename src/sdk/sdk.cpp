// SDK initialization
#include "sdk/sdk.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"
#include "tool/builtin/builtins.hpp"

namespace subagent {

void init(const Config& config) {
  // 初始化日志系统
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);

  spdlog::debug("[SDK] version={}, worker_threads={}, max_concurrent={}, max_iterations={}", version(),
                config.subagent.worker_threads, config.subagent.max_concurrent, config.subagent.max_iterations);
}

void shutdown() {
  spdlog::shutdown();
}

std::string version() {
  return SUBAGENT_SDK_VERSION_STRING;
}

Runtime make_runtime(std::shared_ptr<llm::Provider> provider, const Config& config) {
  Runtime runtime;
  runtime.config = config;
  runtime.bus = std::make_shared<Bus>();
  runtime.tools = std::make_shared<ToolRegistry>();
  runtime.executor = std::make_shared<SubagentExecutor>(std::move(provider), runtime.tools, config.subagent.max_iterations);
  runtime.manager = std::make_shared<LifecycleManager>(runtime.executor, LifecycleOptions::from_config(config), runtime.bus);

  tools::register_builtins(*runtime.tools, runtime.manager, config);

  spdlog::debug("[SDK] Runtime ready with {} tools", runtime.tools->all().size());
  return runtime;
}

}  // namespace subagent
