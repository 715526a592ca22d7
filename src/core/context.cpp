#include "core/context.hpp"

namespace subagent {

struct ExecContext::State {
  std::shared_ptr<State> parent;
  std::optional<Clock::time_point> deadline;
  bool cancellable = true;
  std::atomic<ContextError> err{ContextError::None};

  void latch(ContextError cause) {
    ContextError expected = ContextError::None;
    err.compare_exchange_strong(expected, cause);
  }

  ContextError evaluate() {
    auto current = err.load();
    if (current != ContextError::None) {
      return current;
    }

    if (deadline && Clock::now() >= *deadline) {
      latch(ContextError::DeadlineExceeded);
    } else if (parent) {
      auto inherited = parent->evaluate();
      if (inherited != ContextError::None) {
        latch(inherited);
      }
    }
    return err.load();
  }
};

std::string to_string(ContextError err) {
  switch (err) {
    case ContextError::None:
      return "none";
    case ContextError::Cancelled:
      return "context cancelled";
    case ContextError::DeadlineExceeded:
      return "context deadline exceeded";
  }
  return "none";
}

ExecContext::ExecContext() : ExecContext(background()) {}

ExecContext::ExecContext(std::shared_ptr<State> state) : state_(std::move(state)) {}

ExecContext ExecContext::background() {
  auto state = std::make_shared<State>();
  state->cancellable = false;
  return ExecContext(std::move(state));
}

ExecContext ExecContext::with_cancel(const ExecContext& parent) {
  auto state = std::make_shared<State>();
  state->parent = parent.state_;
  return ExecContext(std::move(state));
}

ExecContext ExecContext::with_timeout(const ExecContext& parent, Clock::duration timeout) {
  return with_deadline(parent, Clock::now() + timeout);
}

ExecContext ExecContext::with_deadline(const ExecContext& parent, Clock::time_point deadline) {
  auto state = std::make_shared<State>();
  state->parent = parent.state_;
  state->deadline = deadline;
  return ExecContext(std::move(state));
}

void ExecContext::cancel() const {
  if (state_->cancellable) {
    state_->latch(ContextError::Cancelled);
  }
}

ContextError ExecContext::error() const {
  return state_->evaluate();
}

std::optional<ExecContext::Clock::time_point> ExecContext::deadline() const {
  std::optional<Clock::time_point> nearest;
  for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->deadline && (!nearest || *s->deadline < *nearest)) {
      nearest = s->deadline;
    }
  }
  return nearest;
}

}  // namespace subagent
