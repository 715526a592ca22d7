#include "subagent/lifecycle_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace subagent {

namespace {

using Clock = std::chrono::steady_clock;

Milliseconds elapsed_ms(Clock::time_point since) {
  return std::chrono::duration_cast<Milliseconds>(Clock::now() - since);
}

}  // namespace

LifecycleOptions LifecycleOptions::from_config(const Config& config) {
  LifecycleOptions options;
  options.worker_threads = config.subagent.worker_threads;
  options.max_concurrent = config.subagent.max_concurrent;
  options.shutdown_timeout = config.subagent.shutdown_timeout;
  options.shutdown_poll_interval = config.subagent.shutdown_poll_interval;
  return options;
}

LifecycleManager::LifecycleManager(std::shared_ptr<Executor> executor, LifecycleOptions options, std::shared_ptr<Bus> bus)
    : executor_(std::move(executor)),
      options_(options),
      bus_(std::move(bus)),
      pool_(std::max<size_t>(options.worker_threads, 1)) {}

LifecycleManager::~LifecycleManager() {
  {
    std::unique_lock lock(mutex_);
    shutting_down_ = true;
    for (const auto& [id, entry] : entries_) {
      std::shared_lock entry_lock(entry->mutex);
      entry->exec_ctx.cancel();
    }
  }

  // Queued runs see the cancelled context on their first check and finish at once
  pool_.join();
}

Result<void> LifecycleManager::start(const ExecContext& ctx, const SubagentContext& subagent_ctx) {
  auto valid = subagent_ctx.validate();
  if (!valid.ok()) {
    return Result<void>::failure(ErrorCode::Validation, "invalid subagent context: " + valid.error->message);
  }

  auto entry = std::make_shared<Entry>();
  entry->context = subagent_ctx;
  entry->result.subagent_id = subagent_ctx.id;
  entry->result.status = SubagentStatus::Running;
  entry->start_time = Clock::now();

  // Held until Running has been announced, so no terminal notification for
  // this entry can overtake it
  std::unique_lock announce(entry->notify_mutex);

  {
    std::unique_lock lock(mutex_);

    // Checked under the map lock: shutdown() flips the flag under the same
    // lock before it snapshots the entries
    if (shutting_down_) {
      return Result<void>::failure(ErrorCode::Cancelled, "lifecycle manager is shutting down");
    }

    if (entries_.count(subagent_ctx.id) > 0) {
      return Result<void>::failure(ErrorCode::AlreadyExists, "subagent " + subagent_ctx.id + " is already running");
    }

    if (options_.max_concurrent > 0) {
      size_t running = 0;
      for (const auto& [id, other] : entries_) {
        std::shared_lock entry_lock(other->mutex);
        if (other->result.status == SubagentStatus::Running) {
          ++running;
        }
      }
      if (running >= options_.max_concurrent) {
        return Result<void>::failure(ErrorCode::ResourceExhausted,
                                     "too many running subagents (limit " + std::to_string(options_.max_concurrent) + ")");
      }
    }

    // The deadline clock starts now, even if the run waits for a worker
    entry->exec_ctx = ExecContext::with_timeout(ctx, subagent_ctx.limits.timeout);
    entries_[subagent_ctx.id] = entry;
  }

  spdlog::info("[LifecycleManager] Started subagent {} (skill={}, parent={})", subagent_ctx.id, subagent_ctx.skill_name,
               subagent_ctx.parent_context_id);

  notify(subagent_ctx.id, SubagentStatus::Running);
  if (bus_) {
    bus_->publish(events::SubagentStarted{subagent_ctx.id, subagent_ctx.parent_context_id, subagent_ctx.skill_name});
  }
  announce.unlock();

  asio::post(pool_, [this, entry]() {
    run(entry);
  });

  return Result<void>::success();
}

void LifecycleManager::run(const std::shared_ptr<Entry>& entry) {
  ExecContext exec_ctx;
  {
    std::shared_lock lock(entry->mutex);
    exec_ctx = entry->exec_ctx;
  }

  const auto& id = entry->context.id;

  Result<SubagentResult> outcome = Result<SubagentResult>::failure(ErrorCode::Internal, "executor did not run");
  try {
    outcome = executor_->execute(exec_ctx, entry->context);
  } catch (const std::exception& e) {
    spdlog::error("[LifecycleManager] Executor threw for {}: {}", id, e.what());
    outcome = Result<SubagentResult>::failure(ErrorCode::Internal, e.what());
  }

  // Release the deadline; nothing observes it past this point
  exec_ctx.cancel();

  SubagentResult final_result;
  if (outcome.ok()) {
    final_result = std::move(*outcome.value);
    if (!is_terminal(final_result.status)) {
      final_result.status = SubagentStatus::Error;
      final_result.error_message = "executor returned non-terminal status";
    }
  } else {
    final_result.subagent_id = id;
    final_result.status = SubagentStatus::Error;
    final_result.error_message = outcome.error->message;
    final_result.execution_time = elapsed_ms(entry->start_time);
    final_result.completed_at = std::chrono::system_clock::now();
  }
  final_result.subagent_id = id;

  bool transitioned = false;
  {
    std::unique_lock lock(entry->mutex);
    if (!is_terminal(entry->result.status)) {
      entry->result = final_result;
      transitioned = true;
    }
  }

  if (!transitioned) {
    spdlog::debug("[LifecycleManager] Subagent {} already terminal, discarding late {} result", id, to_string(final_result.status));
    return;
  }

  spdlog::info("[LifecycleManager] Subagent {} finished: {} ({} ms, {} tokens, {} tool calls)", id, to_string(final_result.status),
               final_result.execution_time.count(), final_result.tokens_used, final_result.tool_calls_made);

  std::lock_guard announce(entry->notify_mutex);
  notify(id, final_result.status);
  publish_finished(final_result);
}

Result<void> LifecycleManager::cancel(const ExecContext& /* ctx */, const SubagentId& subagent_id) {
  auto entry = find(subagent_id);
  if (!entry) {
    return Result<void>::failure(ErrorCode::NotFound, "subagent " + subagent_id + " not found");
  }

  std::optional<SubagentResult> cancelled;
  {
    std::unique_lock lock(entry->mutex);
    entry->exec_ctx.cancel();
    if (entry->result.status == SubagentStatus::Running) {
      entry->result.status = SubagentStatus::Cancelled;
      entry->result.error_message = "cancelled by user";
      entry->result.execution_time = elapsed_ms(entry->start_time);
      entry->result.completed_at = std::chrono::system_clock::now();
      cancelled = entry->result;
    }
  }

  if (cancelled) {
    spdlog::info("[LifecycleManager] Cancelled subagent {}", subagent_id);
    std::lock_guard announce(entry->notify_mutex);
    notify(subagent_id, SubagentStatus::Cancelled);
    publish_finished(*cancelled);
  } else {
    spdlog::debug("[LifecycleManager] Cancel on terminal subagent {} ignored", subagent_id);
  }

  return Result<void>::success();
}

Result<SubagentResult> LifecycleManager::get_status(const ExecContext& /* ctx */, const SubagentId& subagent_id) const {
  auto entry = find(subagent_id);
  if (!entry) {
    return Result<SubagentResult>::failure(ErrorCode::NotFound, "subagent " + subagent_id + " not found");
  }

  std::shared_lock lock(entry->mutex);
  return Result<SubagentResult>::success(entry->result);
}

std::vector<SubagentId> LifecycleManager::list_running(const ExecContext& /* ctx */) const {
  std::shared_lock lock(mutex_);

  std::vector<SubagentId> running;
  for (const auto& [id, entry] : entries_) {
    std::shared_lock entry_lock(entry->mutex);
    if (entry->result.status == SubagentStatus::Running) {
      running.push_back(id);
    }
  }
  return running;
}

void LifecycleManager::set_monitoring_hook(MonitoringHook hook) {
  std::unique_lock lock(hook_mutex_);
  hook_ = std::move(hook);
}

Result<void> LifecycleManager::shutdown(const ExecContext& ctx) {
  std::vector<SubagentId> ids;
  {
    std::unique_lock lock(mutex_);
    shutting_down_ = true;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      ids.push_back(id);
    }
  }

  spdlog::info("[LifecycleManager] Shutting down, cancelling {} subagent(s)", ids.size());

  for (const auto& id : ids) {
    auto cancelled = cancel(ctx, id);
    if (!cancelled.ok()) {
      // Evicted concurrently; nothing left to stop
      spdlog::warn("[LifecycleManager] Shutdown could not cancel {}: {}", id, cancelled.error->message);
    }
  }

  auto deadline = ctx.deadline().value_or(Clock::now() + options_.shutdown_timeout);

  while (true) {
    if (list_running(ctx).empty()) {
      spdlog::info("[LifecycleManager] Shutdown complete");
      return Result<void>::success();
    }
    if (ctx.error() == ContextError::Cancelled) {
      return Result<void>::failure(ErrorCode::Cancelled, "shutdown cancelled");
    }
    if (Clock::now() >= deadline) {
      spdlog::warn("[LifecycleManager] Shutdown timed out with subagents still running");
      return Result<void>::failure(ErrorCode::Timeout, "shutdown timeout: some subagents still running");
    }
    std::this_thread::sleep_for(options_.shutdown_poll_interval);
  }
}

Result<void> LifecycleManager::evict(const SubagentId& subagent_id) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(subagent_id);
  if (it == entries_.end()) {
    return Result<void>::failure(ErrorCode::NotFound, "subagent " + subagent_id + " not found");
  }

  {
    std::shared_lock entry_lock(it->second->mutex);
    if (!is_terminal(it->second->result.status)) {
      return Result<void>::failure(ErrorCode::Validation, "subagent " + subagent_id + " is still running");
    }
  }

  entries_.erase(it);
  lock.unlock();

  spdlog::debug("[LifecycleManager] Evicted subagent {}", subagent_id);
  if (bus_) {
    bus_->publish(events::SubagentEvicted{subagent_id});
  }
  return Result<void>::success();
}

size_t LifecycleManager::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::shared_ptr<LifecycleManager::Entry> LifecycleManager::find(const SubagentId& subagent_id) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(subagent_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

void LifecycleManager::notify(const SubagentId& subagent_id, SubagentStatus status) {
  MonitoringHook hook;
  {
    std::shared_lock lock(hook_mutex_);
    hook = hook_;
  }

  if (hook) {
    hook(subagent_id, status);
  }
}

void LifecycleManager::publish_finished(const SubagentResult& result) {
  if (!bus_) {
    return;
  }
  bus_->publish(events::SubagentFinished{result.subagent_id, to_string(result.status), result.error_message, result.tokens_used,
                                         result.tool_calls_made});
}

}  // namespace subagent
