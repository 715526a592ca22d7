#pragma once

#include <memory>
#include <string>

#include "core/context.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "subagent/types.hpp"
#include "tool/tool.hpp"

namespace subagent {

// Anything that can run, cancel and report on subagents
class Executor {
 public:
  virtual ~Executor() = default;

  // Runs one subagent to a terminal status. Business failures are reported
  // in-band through the result's status; an error return means the call
  // itself was misused.
  virtual Result<SubagentResult> execute(const ExecContext& ctx, const SubagentContext& subagent_ctx) = 0;

  virtual Result<void> cancel(const ExecContext& ctx, const SubagentId& subagent_id) = 0;

  virtual Result<SubagentResult> get_status(const ExecContext& ctx, const SubagentId& subagent_id) = 0;
};

// Autonomous LLM + tools loop for a single subagent
class SubagentExecutor : public Executor {
 public:
  static constexpr int kDefaultMaxIterations = 50;

  SubagentExecutor(std::shared_ptr<llm::Provider> provider, std::shared_ptr<ToolExecutor> tools, int max_iterations = kDefaultMaxIterations);

  Result<SubagentResult> execute(const ExecContext& ctx, const SubagentContext& subagent_ctx) override;

  // A bare executor keeps no record of past runs; use LifecycleManager to
  // supervise them.
  Result<void> cancel(const ExecContext& ctx, const SubagentId& subagent_id) override;

  Result<SubagentResult> get_status(const ExecContext& ctx, const SubagentId& subagent_id) override;

  int max_iterations() const {
    return max_iterations_;
  }

 private:
  std::shared_ptr<llm::Provider> provider_;
  std::shared_ptr<ToolExecutor> tools_;
  int max_iterations_;
};

}  // namespace subagent
