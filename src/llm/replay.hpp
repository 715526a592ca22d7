#pragma once

#include <filesystem>
#include <mutex>

#include "llm/provider.hpp"

namespace subagent::llm {

// Offline provider that answers from a fixed script, one response per call.
// Used for demos and for exercising skills without network access.
class ReplayProvider : public Provider {
 public:
  explicit ReplayProvider(std::vector<LlmResponse> script, Milliseconds latency = Milliseconds(0));

  // Script file: JSON array of response objects (see LlmResponse::from_json)
  static Result<std::shared_ptr<ReplayProvider>> load(const std::filesystem::path& path, Milliseconds latency = Milliseconds(0));

  std::string name() const override {
    return "replay";
  }

  std::future<LlmResponse> complete(const LlmRequest& request, const ExecContext& ctx) override;

  size_t calls() const;

  size_t remaining() const;

 private:
  mutable std::mutex mutex_;
  std::vector<LlmResponse> script_;
  size_t next_ = 0;
  Milliseconds latency_;
};

}  // namespace subagent::llm
