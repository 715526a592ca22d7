#include "subagent/executor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace subagent {

namespace {

using Clock = std::chrono::steady_clock;

Milliseconds elapsed_ms(Clock::time_point since) {
  return std::chrono::duration_cast<Milliseconds>(Clock::now() - since);
}

// Running totals and the result being built for one execute() call
struct RunState {
  SubagentResult result;
  int64_t tokens_used = 0;
  int tool_calls_made = 0;
  Clock::time_point start = Clock::now();

  SubagentResult finalize(SubagentStatus status, std::string error_message = "") {
    result.status = status;
    result.error_message = std::move(error_message);
    result.execution_time = elapsed_ms(start);
    result.completed_at = std::chrono::system_clock::now();
    result.tokens_used = tokens_used;
    result.tool_calls_made = tool_calls_made;

    if (status == SubagentStatus::Complete) {
      spdlog::debug("[Subagent {}] Complete: steps={}, tokens={}, tool_calls={}", result.subagent_id, result.step_results.size(),
                    tokens_used, tool_calls_made);
    } else {
      spdlog::debug("[Subagent {}] Finished with {}: {}", result.subagent_id, to_string(status), result.error_message);
    }
    return std::move(result);
  }
};

}  // namespace

SubagentExecutor::SubagentExecutor(std::shared_ptr<llm::Provider> provider, std::shared_ptr<ToolExecutor> tools, int max_iterations)
    : provider_(std::move(provider)), tools_(std::move(tools)), max_iterations_(max_iterations > 0 ? max_iterations : kDefaultMaxIterations) {}

Result<SubagentResult> SubagentExecutor::execute(const ExecContext& ctx, const SubagentContext& subagent_ctx) {
  auto valid = subagent_ctx.validate();
  if (!valid.ok()) {
    return Result<SubagentResult>::failure(ErrorCode::Validation, "invalid subagent context: " + valid.error->message);
  }

  const auto& limits = subagent_ctx.limits;

  RunState run;
  run.result.subagent_id = subagent_ctx.id;
  run.result.status = SubagentStatus::Running;
  run.result.metadata = json::object();

  if (!provider_) {
    return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, "No LLM provider configured"));
  }

  // Private working copy; the context itself is never modified
  Conversation conversation = subagent_ctx.conversation_history;

  spdlog::debug("[Subagent {}] Starting: skill={}, parent={}, limits={}", subagent_ctx.id, subagent_ctx.skill_name,
                subagent_ctx.parent_context_id, limits.to_json().dump());

  int step_number = 1;

  for (int i = 0; i < max_iterations_; ++i) {
    // Cooperative cancellation, observed only between steps
    auto ctx_err = ctx.error();
    if (ctx_err == ContextError::DeadlineExceeded) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Timeout, "execution deadline exceeded"));
    }
    if (ctx_err == ContextError::Cancelled) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Cancelled, "execution cancelled"));
    }

    if (!limits.is_within_limits(run.tokens_used, run.tool_calls_made, Clock::now() - run.start)) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Timeout, "resource limits exceeded"));
    }

    auto step_start = Clock::now();

    llm::LlmRequest request;
    request.messages = conversation;
    request.subagent_id = subagent_ctx.id;
    request.skill_name = subagent_ctx.skill_name;

    spdlog::debug("[Subagent {}] Step {} - LLM request with {} messages", subagent_ctx.id, step_number, request.messages.size());

    llm::LlmResponse response;
    try {
      response = provider_->complete(request, ctx).get();
    } catch (const std::exception& e) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, std::string("LLM error: ") + e.what()));
    }

    if (!response.ok()) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, "LLM error: " + *response.error));
    }

    // Token cost is only known once the response arrives, so this budget is
    // enforced after the call.
    auto step_tokens = response.usage.total();
    run.tokens_used += step_tokens;
    if (limits.max_tokens > 0 && run.tokens_used > limits.max_tokens) {
      return Result<SubagentResult>::success(run.finalize(
          SubagentStatus::Error, "token limit exceeded: " + std::to_string(run.tokens_used) + " > " + std::to_string(limits.max_tokens)));
    }

    conversation.push_back(ChatMessage::assistant(response.content));

    SubagentStepResult step;
    step.step_number = step_number++;
    step.action = "LLM call (finish: " + to_string(response.finish_reason) + ", tools: " + std::to_string(response.tool_calls.size()) + ")";
    step.result = response.content;
    step.tokens_used = step_tokens;
    step.duration = elapsed_ms(step_start);
    run.result.step_results.push_back(std::move(step));

    if (response.is_final()) {
      run.result.output = response.content;
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Complete));
    }

    for (const auto& call : response.tool_calls) {
      // Checked before the call so the budget is never overrun
      if (limits.max_tool_calls > 0 && run.tool_calls_made >= limits.max_tool_calls) {
        return Result<SubagentResult>::success(
            run.finalize(SubagentStatus::Error, "tool call limit exceeded: " + std::to_string(run.tool_calls_made) +
                                                    " >= " + std::to_string(limits.max_tool_calls)));
      }

      if (!is_tool_allowed(call.name, subagent_ctx.allowed_tools)) {
        return Result<SubagentResult>::success(run.finalize(
            SubagentStatus::Error, "tool '" + call.name + "' not allowed (allowed: " + describe(subagent_ctx.allowed_tools) + ")"));
      }

      if (!tools_) {
        return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, "tool execution error: no tool executor configured"));
      }

      spdlog::debug("[Subagent {}] Tool call: {} {}", subagent_ctx.id, call.name, call.arguments.dump());

      ToolResult tool_result;
      try {
        tool_result = tools_->execute(ctx, call.name, call.arguments).get();
      } catch (const std::exception& e) {
        return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, std::string("tool execution error: ") + e.what()));
      }

      if (tool_result.is_error) {
        return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, "tool execution error: " + tool_result.output));
      }

      run.tool_calls_made++;

      conversation.push_back(ChatMessage::user("Tool result from " + call.name + ": " + tool_result.output));
    }

    if (!limits.is_within_limits(run.tokens_used, run.tool_calls_made, Clock::now() - run.start)) {
      return Result<SubagentResult>::success(run.finalize(SubagentStatus::Error, "resource limits exceeded after tool calls"));
    }
  }

  spdlog::warn("[Subagent {}] Hit iteration ceiling of {}", subagent_ctx.id, max_iterations_);
  return Result<SubagentResult>::success(
      run.finalize(SubagentStatus::Error, "max iterations (" + std::to_string(max_iterations_) + ") reached"));
}

Result<void> SubagentExecutor::cancel(const ExecContext& /* ctx */, const SubagentId& subagent_id) {
  return Result<void>::failure(ErrorCode::NotFound, "subagent " + subagent_id + " is not tracked by this executor");
}

Result<SubagentResult> SubagentExecutor::get_status(const ExecContext& /* ctx */, const SubagentId& subagent_id) {
  return Result<SubagentResult>::failure(ErrorCode::NotFound, "subagent " + subagent_id + " is not tracked by this executor");
}

}  // namespace subagent
