#include "subagent/types.hpp"

#include <algorithm>

namespace subagent {

std::string to_string(SubagentStatus status) {
  switch (status) {
    case SubagentStatus::Pending:
      return "pending";
    case SubagentStatus::Running:
      return "running";
    case SubagentStatus::Complete:
      return "complete";
    case SubagentStatus::Error:
      return "error";
    case SubagentStatus::Timeout:
      return "timeout";
    case SubagentStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<SubagentStatus> subagent_status_from_string(const std::string& str) {
  if (str == "pending") return SubagentStatus::Pending;
  if (str == "running") return SubagentStatus::Running;
  if (str == "complete") return SubagentStatus::Complete;
  if (str == "error") return SubagentStatus::Error;
  if (str == "timeout") return SubagentStatus::Timeout;
  if (str == "cancelled") return SubagentStatus::Cancelled;
  return std::nullopt;
}

bool is_terminal(SubagentStatus status) {
  return status == SubagentStatus::Complete || status == SubagentStatus::Error || status == SubagentStatus::Timeout ||
         status == SubagentStatus::Cancelled;
}

// ============================================================================
// ResourceLimits
// ============================================================================

ResourceLimits ResourceLimits::defaults() {
  return ResourceLimits{100000, 50, std::chrono::minutes(5)};
}

bool ResourceLimits::is_within_limits(int64_t tokens_used, int tool_calls_made, std::chrono::steady_clock::duration elapsed) const {
  if (max_tokens > 0 && tokens_used > max_tokens) {
    return false;
  }
  if (max_tool_calls > 0 && tool_calls_made > max_tool_calls) {
    return false;
  }
  if (timeout.count() > 0 && elapsed > timeout) {
    return false;
  }
  return true;
}

Result<void> ResourceLimits::validate() const {
  if (timeout.count() <= 0) {
    return Result<void>::failure(ErrorCode::Validation, "timeout must be positive");
  }
  if (max_tokens < 0) {
    return Result<void>::failure(ErrorCode::Validation, "max tokens must be non-negative");
  }
  if (max_tool_calls < 0) {
    return Result<void>::failure(ErrorCode::Validation, "max tool calls must be non-negative");
  }
  return Result<void>::success();
}

json ResourceLimits::to_json() const {
  return json{{"max_tokens", max_tokens}, {"max_tool_calls", max_tool_calls}, {"timeout_ms", timeout.count()}};
}

ResourceLimits ResourceLimits::from_json(const json& j, const ResourceLimits& fallback) {
  ResourceLimits limits;
  limits.max_tokens = j.value("max_tokens", fallback.max_tokens);
  limits.max_tool_calls = j.value("max_tool_calls", fallback.max_tool_calls);
  limits.timeout = Milliseconds(j.value("timeout_ms", static_cast<int64_t>(fallback.timeout.count())));
  return limits;
}

// ============================================================================
// Tool allowlist
// ============================================================================

bool is_tool_allowed(const std::string& tool_name, const ToolAllowlist& allowed_tools) {
  if (!allowed_tools) {
    return true;
  }
  return std::find(allowed_tools->begin(), allowed_tools->end(), tool_name) != allowed_tools->end();
}

std::string describe(const ToolAllowlist& allowed_tools) {
  if (!allowed_tools) {
    return "all";
  }
  std::string joined = "[";
  for (size_t i = 0; i < allowed_tools->size(); ++i) {
    if (i > 0) joined += ", ";
    joined += (*allowed_tools)[i];
  }
  joined += "]";
  return joined;
}

// ============================================================================
// SubagentContext
// ============================================================================

Result<void> SubagentContext::validate() const {
  if (id.empty()) {
    return Result<void>::failure(ErrorCode::Validation, "subagent context ID is required");
  }
  if (parent_context_id.empty()) {
    return Result<void>::failure(ErrorCode::Validation, "parent context ID is required");
  }
  if (skill_name.empty()) {
    return Result<void>::failure(ErrorCode::Validation, "skill name is required");
  }
  return limits.validate();
}

json SubagentContext::to_json() const {
  json j;
  j["id"] = id;
  j["parent_context_id"] = parent_context_id;
  j["skill_name"] = skill_name;
  j["allowed_tools"] = allowed_tools ? json(*allowed_tools) : json(nullptr);
  j["limits"] = limits.to_json();
  j["conversation_history"] = subagent::to_json(conversation_history);
  j["created_at"] = to_unix_millis(created_at);
  j["metadata"] = metadata;
  return j;
}

// ============================================================================
// Results
// ============================================================================

json SubagentStepResult::to_json() const {
  return json{{"step_number", step_number},
              {"action", action},
              {"result", result},
              {"tokens_used", tokens_used},
              {"duration_ms", duration.count()}};
}

Result<void> SubagentResult::validate() const {
  if (subagent_id.empty()) {
    return Result<void>::failure(ErrorCode::Validation, "subagent ID is required");
  }
  if (status == SubagentStatus::Error && error_message.empty()) {
    return Result<void>::failure(ErrorCode::Validation, "error message required when status is error");
  }
  return Result<void>::success();
}

json SubagentResult::to_json() const {
  json j;
  j["subagent_id"] = subagent_id;
  j["status"] = subagent::to_string(status);
  j["output"] = output;
  if (!error_message.empty()) {
    j["error_message"] = error_message;
  }
  j["tokens_used"] = tokens_used;
  j["tool_calls_made"] = tool_calls_made;
  j["execution_time_ms"] = execution_time.count();
  if (completed_at) {
    j["completed_at"] = to_unix_millis(*completed_at);
  }

  json steps = json::array();
  for (const auto& step : step_results) {
    steps.push_back(step.to_json());
  }
  j["step_results"] = steps;
  j["metadata"] = metadata;
  return j;
}

}  // namespace subagent
