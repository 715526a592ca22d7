#pragma once

#include <string>

#include "core/message.hpp"
#include "core/types.hpp"
#include "subagent/types.hpp"

namespace subagent {

// Builds isolated execution contexts for subagents. Stateless: forking never
// registers the context anywhere.
class ContextForker {
 public:
  ContextForker() = default;

  // Copies history and allowlist into fresh containers, so later changes on
  // either side stay invisible to the other. Fails with a validation error on
  // an empty parent ID or skill name, or on invalid limits.
  Result<SubagentContext> fork(const ContextId& parent_context_id, const Conversation& parent_history, const std::string& skill_name,
                               const ToolAllowlist& allowed_tools, const ResourceLimits& limits) const;
};

}  // namespace subagent
