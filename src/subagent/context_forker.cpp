#include "subagent/context_forker.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace subagent {

Result<SubagentContext> ContextForker::fork(const ContextId& parent_context_id, const Conversation& parent_history,
                                            const std::string& skill_name, const ToolAllowlist& allowed_tools,
                                            const ResourceLimits& limits) const {
  if (parent_context_id.empty()) {
    return Result<SubagentContext>::failure(ErrorCode::Validation, "parent context ID is required");
  }
  if (skill_name.empty()) {
    return Result<SubagentContext>::failure(ErrorCode::Validation, "skill name is required");
  }

  SubagentContext ctx;
  ctx.id = UUID::with_prefix("subagent");
  ctx.parent_context_id = parent_context_id;
  ctx.skill_name = skill_name;
  ctx.limits = limits;

  ctx.conversation_history.reserve(parent_history.size());
  for (const auto& msg : parent_history) {
    ctx.conversation_history.push_back(ChatMessage{msg.role, msg.content});
  }

  // nullopt stays unrestricted, empty stays empty
  if (allowed_tools) {
    ctx.allowed_tools.emplace(allowed_tools->begin(), allowed_tools->end());
  }

  ctx.created_at = std::chrono::system_clock::now();
  ctx.metadata = json::object();

  auto valid = ctx.validate();
  if (!valid.ok()) {
    return Result<SubagentContext>::failure(ErrorCode::Validation, "failed to create valid subagent context: " + valid.error->message);
  }

  spdlog::debug("[ContextForker] Forked {} from {} (skill={}, history={}, tools={})", ctx.id, parent_context_id, skill_name,
                ctx.conversation_history.size(), describe(ctx.allowed_tools));

  return Result<SubagentContext>::success(std::move(ctx));
}

}  // namespace subagent
