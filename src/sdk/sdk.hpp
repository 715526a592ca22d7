#pragma once

#include <memory>
#include <string>

#include "bus/bus.hpp"
#include "core/config.hpp"
#include "llm/provider.hpp"
#include "subagent/context_forker.hpp"
#include "subagent/executor.hpp"
#include "subagent/lifecycle_manager.hpp"
#include "tool/tool.hpp"

namespace subagent {

// Initialize logging from config
void init(const Config& config);

// Flush and release loggers
void shutdown();

// Get version string
std::string version();

// Components wired together for one process. The registry already carries the
// spawn_subagent, subagent_status and cancel_subagent tools.
struct Runtime {
  Config config;
  std::shared_ptr<Bus> bus;
  std::shared_ptr<ToolRegistry> tools;
  std::shared_ptr<SubagentExecutor> executor;
  std::shared_ptr<LifecycleManager> manager;
  ContextForker forker;
};

Runtime make_runtime(std::shared_ptr<llm::Provider> provider, const Config& config);

}  // namespace subagent
