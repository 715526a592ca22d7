#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace subagent {

using json = nlohmann::json;

// Type aliases
using SubagentId = std::string;
using ContextId = std::string;

using Timestamp = std::chrono::system_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Error categories surfaced by the public API
enum class ErrorCode {
  Validation,         // Bad input, rejected with no side effects
  NotFound,           // Unknown subagent ID
  AlreadyExists,      // Duplicate subagent ID
  ResourceExhausted,  // Admission limit reached
  Timeout,            // Deadline elapsed
  Cancelled,          // Caller cancelled or manager shut down
  Internal
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::Internal;
  std::string message;

  // "<code>: <message>"
  std::string describe() const;
};

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<Error> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::nullopt, std::move(err)};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{std::nullopt, Error{code, std::move(message)}};
  }
};

// Value-less variant for operations that only report success or failure
template <>
struct Result<void> {
  std::optional<Error> error;

  bool ok() const {
    return !error.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success() {
    return Result{std::nullopt};
  }

  static Result failure(Error err) {
    return Result{std::move(err)};
  }

  static Result failure(ErrorCode code, std::string message) {
    return Result{Error{code, std::move(message)}};
  }
};

// Token usage reported by one LLM round-trip
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    return *this;
  }
};

// Finish reason for LLM responses
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Needs tool execution
  Length,     // Token limit reached
  Error,      // Error occurred
  Cancelled   // User cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// Timestamp helpers for JSON output
int64_t to_unix_millis(Timestamp ts);

Timestamp from_unix_millis(int64_t millis);

}  // namespace subagent
