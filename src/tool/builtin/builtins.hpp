#pragma once

#include <memory>

#include "core/config.hpp"
#include "subagent/context_forker.hpp"
#include "subagent/lifecycle_manager.hpp"
#include "tool/tool.hpp"

namespace subagent::tools {

// Tools hold the manager weakly: the manager's executor usually owns the
// registry these tools live in.

// spawn_subagent - fork the caller's task into a background subagent
class SpawnSubagentTool : public SimpleTool {
 public:
  SpawnSubagentTool(std::shared_ptr<LifecycleManager> manager, Config config);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

 private:
  std::future<ToolResult> spawn(const json& args, const ToolContext& ctx);

  std::weak_ptr<LifecycleManager> manager_;
  Config config_;
  ContextForker forker_;
};

// subagent_status - report a subagent's current result
class SubagentStatusTool : public SimpleTool {
 public:
  explicit SubagentStatusTool(std::shared_ptr<LifecycleManager> manager);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

 private:
  std::weak_ptr<LifecycleManager> manager_;
};

// cancel_subagent - request cancellation of a running subagent
class CancelSubagentTool : public SimpleTool {
 public:
  explicit CancelSubagentTool(std::shared_ptr<LifecycleManager> manager);

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

 private:
  std::weak_ptr<LifecycleManager> manager_;
};

// Register the subagent tools on a registry
void register_builtins(ToolRegistry& registry, const std::shared_ptr<LifecycleManager>& manager, const Config& config);

}  // namespace subagent::tools
