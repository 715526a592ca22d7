#include "core/types.hpp"

namespace subagent {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:
      return "validation";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ResourceExhausted:
      return "resource_exhausted";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::Internal:
      return "internal";
  }
  return "internal";
}

std::string Error::describe() const {
  return to_string(code) + ": " + message;
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string &str) {
  if (str == "stop" || str == "end_turn") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

int64_t to_unix_millis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_unix_millis(int64_t millis) {
  return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis))};
}

}  // namespace subagent
