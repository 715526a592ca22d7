#include "builtins.hpp"

namespace subagent::tools {

// ============================================================================
// SubagentStatusTool
// ============================================================================

SubagentStatusTool::SubagentStatusTool(std::shared_ptr<LifecycleManager> manager)
    : SimpleTool("subagent_status", "Get the status and result of a subagent."), manager_(std::move(manager)) {}

std::vector<ParameterSchema> SubagentStatusTool::parameters() const {
  return {{"subagent_id", "string", "ID returned by spawn_subagent", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> SubagentStatusTool::execute(const json& args, const ToolContext& ctx) {
  auto manager = manager_.lock();
  if (!manager) {
    return ready_result(ToolResult::error("lifecycle manager is gone"));
  }

  auto status = manager->get_status(ctx.exec_ctx, args.value("subagent_id", ""));
  if (!status.ok()) {
    return ready_result(ToolResult::error(status.error->message));
  }
  return ready_result(ToolResult::success(status.value->to_json().dump(2)));
}

// ============================================================================
// CancelSubagentTool
// ============================================================================

CancelSubagentTool::CancelSubagentTool(std::shared_ptr<LifecycleManager> manager)
    : SimpleTool("cancel_subagent", "Cancel a running subagent."), manager_(std::move(manager)) {}

std::vector<ParameterSchema> CancelSubagentTool::parameters() const {
  return {{"subagent_id", "string", "ID returned by spawn_subagent", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> CancelSubagentTool::execute(const json& args, const ToolContext& ctx) {
  auto manager = manager_.lock();
  if (!manager) {
    return ready_result(ToolResult::error("lifecycle manager is gone"));
  }

  std::string id = args.value("subagent_id", "");
  auto cancelled = manager->cancel(ctx.exec_ctx, id);
  if (!cancelled.ok()) {
    return ready_result(ToolResult::error(cancelled.error->message));
  }

  auto status = manager->get_status(ctx.exec_ctx, id);
  std::string state = status.ok() ? to_string(status.value->status) : "unknown";
  return ready_result(ToolResult::success(json{{"subagent_id", id}, {"status", state}}.dump()));
}

void register_builtins(ToolRegistry& registry, const std::shared_ptr<LifecycleManager>& manager, const Config& config) {
  registry.register_tool(std::make_shared<SpawnSubagentTool>(manager, config));
  registry.register_tool(std::make_shared<SubagentStatusTool>(manager));
  registry.register_tool(std::make_shared<CancelSubagentTool>(manager));
}

}  // namespace subagent::tools
