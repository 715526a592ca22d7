#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/message.hpp"
#include "core/types.hpp"

namespace subagent {

// Execution status of a subagent
enum class SubagentStatus { Pending, Running, Complete, Error, Timeout, Cancelled };

std::string to_string(SubagentStatus status);

std::optional<SubagentStatus> subagent_status_from_string(const std::string& str);

// Complete, Error, Timeout and Cancelled are terminal: no transition leaves them
bool is_terminal(SubagentStatus status);

// Resource budget for one subagent. Zero token or tool-call limits mean unlimited.
struct ResourceLimits {
  int64_t max_tokens = 0;
  int max_tool_calls = 0;
  Milliseconds timeout{0};

  // 100k tokens, 50 tool calls, 5 minutes
  static ResourceLimits defaults();

  // Inclusive: usage exactly at a limit is still within it
  bool is_within_limits(int64_t tokens_used, int tool_calls_made, std::chrono::steady_clock::duration elapsed) const;

  Result<void> validate() const;

  json to_json() const;
  static ResourceLimits from_json(const json& j, const ResourceLimits& fallback = defaults());
};

// Allowlist semantics: nullopt permits every tool, an empty list permits none,
// otherwise exact membership.
using ToolAllowlist = std::optional<std::vector<std::string>>;

bool is_tool_allowed(const std::string& tool_name, const ToolAllowlist& allowed_tools);

std::string describe(const ToolAllowlist& allowed_tools);

// Isolated execution context for one subagent run
struct SubagentContext {
  SubagentId id;
  ContextId parent_context_id;
  std::string skill_name;
  ToolAllowlist allowed_tools;
  ResourceLimits limits;
  Conversation conversation_history;
  Timestamp created_at = std::chrono::system_clock::now();
  json metadata = json::object();

  Result<void> validate() const;

  json to_json() const;
};

// One LLM round-trip
struct SubagentStepResult {
  int step_number = 0;
  std::string action;
  std::string result;
  int64_t tokens_used = 0;
  Milliseconds duration{0};

  json to_json() const;
};

// Outcome of a subagent run
struct SubagentResult {
  SubagentId subagent_id;
  SubagentStatus status = SubagentStatus::Pending;
  std::string output;
  std::string error_message;
  int64_t tokens_used = 0;
  int tool_calls_made = 0;
  Milliseconds execution_time{0};
  std::optional<Timestamp> completed_at;
  std::vector<SubagentStepResult> step_results;
  json metadata = json::object();

  Result<void> validate() const;

  json to_json() const;
};

}  // namespace subagent
