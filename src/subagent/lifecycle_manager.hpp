#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "bus/bus.hpp"
#include "core/config.hpp"
#include "core/context.hpp"
#include "subagent/executor.hpp"
#include "subagent/types.hpp"

namespace subagent {

// Called with Running on start and once per terminal transition, Running
// always first. Runs synchronously on the thread that made the transition,
// so keep it cheap.
using MonitoringHook = std::function<void(const SubagentId& subagent_id, SubagentStatus status)>;

struct LifecycleOptions {
  size_t worker_threads = 8;
  size_t max_concurrent = 0;  // 0 = unbounded
  std::chrono::milliseconds shutdown_timeout{5000};
  std::chrono::milliseconds shutdown_poll_interval{50};

  static LifecycleOptions from_config(const Config& config);
};

// Supervises concurrently running subagents, keyed by SubagentContext::id.
//
// Locking: mutex_ guards the entry map only; each Entry carries its own lock
// for its result and cancel handle, and the map lock is never held while a
// result is written. Terminal statuses are a one-way latch: whichever of
// cancel() or the background completion gets there first wins.
class LifecycleManager {
 public:
  explicit LifecycleManager(std::shared_ptr<Executor> executor, LifecycleOptions options = {}, std::shared_ptr<Bus> bus = nullptr);

  // Cancels everything still running and waits for the workers to drain
  ~LifecycleManager();

  LifecycleManager(const LifecycleManager&) = delete;
  LifecycleManager& operator=(const LifecycleManager&) = delete;

  // Registers the subagent as Running and schedules it in the background.
  // Returns once bookkeeping is done, never waiting for the run itself.
  Result<void> start(const ExecContext& ctx, const SubagentContext& subagent_ctx);

  // Signals cancellation and latches Cancelled if the subagent is still
  // Running. The executor notices at its next step boundary.
  Result<void> cancel(const ExecContext& ctx, const SubagentId& subagent_id);

  // Snapshot copy of the current result
  Result<SubagentResult> get_status(const ExecContext& ctx, const SubagentId& subagent_id) const;

  std::vector<SubagentId> list_running(const ExecContext& ctx) const;

  void set_monitoring_hook(MonitoringHook hook);

  // Cancels every tracked subagent, then polls until none is Running or the
  // deadline (ctx's, else shutdown_timeout) passes. Best effort: work still
  // blocked in a collaborator call keeps its thread until the call returns.
  Result<void> shutdown(const ExecContext& ctx);

  // Drops a finished entry
  Result<void> evict(const SubagentId& subagent_id);

  size_t size() const;

 private:
  struct Entry {
    SubagentContext context;
    SubagentResult result;
    ExecContext exec_ctx;
    std::chrono::steady_clock::time_point start_time;
    mutable std::shared_mutex mutex;

    // Serializes hook and bus notifications for this entry. Recursive so a
    // hook may cancel the subagent it is being told about.
    std::recursive_mutex notify_mutex;
  };

  std::shared_ptr<Entry> find(const SubagentId& subagent_id) const;

  void run(const std::shared_ptr<Entry>& entry);

  void notify(const SubagentId& subagent_id, SubagentStatus status);

  void publish_finished(const SubagentResult& result);

  std::shared_ptr<Executor> executor_;
  LifecycleOptions options_;
  std::shared_ptr<Bus> bus_;

  mutable std::shared_mutex mutex_;
  std::map<SubagentId, std::shared_ptr<Entry>> entries_;

  mutable std::shared_mutex hook_mutex_;
  MonitoringHook hook_;

  std::atomic<bool> shutting_down_{false};

  asio::thread_pool pool_;
};

}  // namespace subagent
