#pragma once

#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/message.hpp"
#include "core/types.hpp"

namespace subagent::llm {

// A tool invocation requested by the model
struct ToolCall {
  std::string id;
  std::string name;
  json arguments = json::object();

  json to_json() const;
  static ToolCall from_json(const json& j);
};

// LLM request
struct LlmRequest {
  std::vector<ChatMessage> messages;

  // Caller identification, forwarded for provider-side logging
  std::string subagent_id;
  std::string skill_name;

  json to_json() const;
};

// LLM response (non-streaming)
struct LlmResponse {
  std::string content;
  std::vector<ToolCall> tool_calls;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
  std::optional<std::string> error;

  bool ok() const {
    return !error.has_value();
  }

  // No further tool calls requested
  bool is_final() const {
    return finish_reason == FinishReason::Stop || tool_calls.empty();
  }

  static LlmResponse failure(std::string message);

  // Accepts Anthropic-style "end_turn"/"tool_use" as well as OpenAI-style finish reasons
  static LlmResponse from_json(const json& j);
};

// Abstract LLM provider interface. Retries, if any, belong to the implementation.
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // Non-streaming completion. The context is advisory: an implementation
  // may abandon work once it is done, but callers never rely on that.
  virtual std::future<LlmResponse> complete(const LlmRequest& request, const ExecContext& ctx) = 0;
};

}  // namespace subagent::llm
