#include <spdlog/spdlog.h>

#include "builtins.hpp"

namespace subagent::tools {

// ============================================================================
// SpawnSubagentTool
// ============================================================================

SpawnSubagentTool::SpawnSubagentTool(std::shared_ptr<LifecycleManager> manager, Config config)
    : SimpleTool("spawn_subagent", "Launch a subagent to handle a bounded subtask in the background. Returns its ID immediately."),
      manager_(std::move(manager)),
      config_(std::move(config)) {}

std::vector<ParameterSchema> SpawnSubagentTool::parameters() const {
  return {{"prompt", "string", "The task for the subagent to perform", true, std::nullopt, std::nullopt},
          {"skill", "string", "Name of the skill the subagent runs", true, std::nullopt, std::nullopt},
          {"parent_context_id", "string", "Conversation the subagent is forked from (defaults to the caller)", false, std::nullopt,
           std::nullopt},
          {"allowed_tools", "array", "Tools the subagent may call (omit for the skill default)", false, std::nullopt, std::nullopt},
          {"max_tokens", "integer", "Token budget (0 = unlimited)", false, std::nullopt, std::nullopt},
          {"max_tool_calls", "integer", "Tool call budget (0 = unlimited)", false, std::nullopt, std::nullopt},
          {"timeout_ms", "integer", "Wall-clock budget in milliseconds", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> SpawnSubagentTool::execute(const json& args, const ToolContext& ctx) {
  try {
    return spawn(args, ctx);
  } catch (const json::exception& e) {
    return ready_result(ToolResult::error(std::string("Invalid spawn_subagent arguments: ") + e.what()));
  }
}

std::future<ToolResult> SpawnSubagentTool::spawn(const json& args, const ToolContext& ctx) {
  std::string prompt = args.value("prompt", "");
  std::string skill = args.value("skill", "");
  std::string parent_id = args.value("parent_context_id", ctx.caller_id);

  auto manager = manager_.lock();
  if (!manager) {
    return ready_result(ToolResult::error("spawn_subagent requires a lifecycle manager"));
  }

  auto profile = config_.get_or_create_skill(skill);

  ResourceLimits limits = *profile.limits;
  limits.max_tokens = args.value("max_tokens", limits.max_tokens);
  limits.max_tool_calls = args.value("max_tool_calls", limits.max_tool_calls);
  if (args.contains("timeout_ms")) {
    limits.timeout = Milliseconds(args["timeout_ms"].get<int64_t>());
  }

  ToolAllowlist allowed_tools = profile.allowed_tools;
  if (args.contains("allowed_tools") && args["allowed_tools"].is_array()) {
    allowed_tools = args["allowed_tools"].get<std::vector<std::string>>();
  }

  Conversation history;
  if (!profile.system_prompt.empty()) {
    history.push_back(ChatMessage::system(profile.system_prompt));
  }
  history.push_back(ChatMessage::user(prompt));

  auto forked = forker_.fork(parent_id, history, skill, allowed_tools, limits);
  if (!forked.ok()) {
    return ready_result(ToolResult::error("Failed to fork subagent: " + forked.error->message));
  }

  // Spawned subagents are detached from the caller's own deadline so they can
  // outlive the tool call that created them.
  auto started = manager->start(ExecContext::background(), *forked.value);
  if (!started.ok()) {
    return ready_result(ToolResult::error("Failed to start subagent: " + started.error->message));
  }

  spdlog::debug("[Tool spawn_subagent] {} forked from {} (skill={})", forked.value->id, parent_id, skill);

  if (ctx.on_progress) {
    ctx.on_progress("Started subagent " + forked.value->id);
  }

  json out = {{"subagent_id", forked.value->id}, {"skill", skill}, {"status", to_string(SubagentStatus::Running)}};
  return ready_result(ToolResult::with_title(out.dump(), "Subagent: " + skill));
}

}  // namespace subagent::tools
