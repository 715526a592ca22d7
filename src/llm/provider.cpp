#include "llm/provider.hpp"

namespace subagent::llm {

json ToolCall::to_json() const {
  return json{{"id", id}, {"name", name}, {"arguments", arguments}};
}

ToolCall ToolCall::from_json(const json& j) {
  ToolCall call;
  call.id = j.value("id", "");
  // Anthropic uses "name"/"input", older payloads use "tool_name"/"arguments"
  call.name = j.contains("name") ? j["name"].get<std::string>() : j.value("tool_name", "");
  if (j.contains("arguments")) {
    call.arguments = j["arguments"];
  } else if (j.contains("input")) {
    call.arguments = j["input"];
  }
  return call;
}

json LlmRequest::to_json() const {
  json request;
  request["messages"] = subagent::to_json(messages);
  if (!subagent_id.empty()) {
    request["subagent_id"] = subagent_id;
  }
  if (!skill_name.empty()) {
    request["skill_name"] = skill_name;
  }
  return request;
}

LlmResponse LlmResponse::failure(std::string message) {
  LlmResponse response;
  response.finish_reason = FinishReason::Error;
  response.error = std::move(message);
  return response;
}

LlmResponse LlmResponse::from_json(const json& j) {
  LlmResponse response;
  response.content = j.value("content", "");

  if (j.contains("tool_calls")) {
    for (const auto& call : j["tool_calls"]) {
      response.tool_calls.push_back(ToolCall::from_json(call));
    }
  }

  if (j.contains("finish_reason")) {
    response.finish_reason = finish_reason_from_string(j["finish_reason"].get<std::string>());
  } else {
    response.finish_reason = response.tool_calls.empty() ? FinishReason::Stop : FinishReason::ToolCalls;
  }

  if (j.contains("usage")) {
    const auto& usage = j["usage"];
    response.usage.input_tokens = usage.value("input_tokens", int64_t{0});
    response.usage.output_tokens = usage.value("output_tokens", int64_t{0});
    // Providers that only report a total
    if (response.usage.total() == 0 && usage.contains("total_tokens")) {
      response.usage.output_tokens = usage["total_tokens"].get<int64_t>();
    }
  }

  if (j.contains("error") && !j["error"].is_null()) {
    response.error = j["error"].get<std::string>();
  }

  return response;
}

}  // namespace subagent::llm
