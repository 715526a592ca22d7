#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace subagent {

// Why a context is done
enum class ContextError { None, Cancelled, DeadlineExceeded };

std::string to_string(ContextError err);

// Cancellation token plus optional deadline, passed explicitly to every
// operation that may block or be abandoned. Copies share the same state.
//
// A derived context is done when it is cancelled, when its own deadline
// passes, or when any ancestor is done. Cancelling a child never affects
// its parent. Expiry is evaluated lazily: callers observe it by polling
// done() or error() at their own checkpoints.
class ExecContext {
 public:
  using Clock = std::chrono::steady_clock;

  // Equivalent to background()
  ExecContext();

  // Root context: never cancelled, no deadline
  static ExecContext background();

  static ExecContext with_cancel(const ExecContext& parent);

  static ExecContext with_timeout(const ExecContext& parent, Clock::duration timeout);

  static ExecContext with_deadline(const ExecContext& parent, Clock::time_point deadline);

  // Idempotent. No-op on a background context.
  void cancel() const;

  bool done() const {
    return error() != ContextError::None;
  }

  // First cause observed wins and is latched
  ContextError error() const;

  // Nearest deadline along the ancestor chain
  std::optional<Clock::time_point> deadline() const;

 private:
  struct State;

  explicit ExecContext(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

}  // namespace subagent
