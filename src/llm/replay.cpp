#include "llm/replay.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <thread>

namespace subagent::llm {

ReplayProvider::ReplayProvider(std::vector<LlmResponse> script, Milliseconds latency) : script_(std::move(script)), latency_(latency) {}

Result<std::shared_ptr<ReplayProvider>> ReplayProvider::load(const std::filesystem::path& path, Milliseconds latency) {
  using R = Result<std::shared_ptr<ReplayProvider>>;

  std::ifstream file(path);
  if (!file.is_open()) {
    return R::failure(ErrorCode::NotFound, "cannot open replay script: " + path.string());
  }

  try {
    json j = json::parse(file);
    if (!j.is_array()) {
      return R::failure(ErrorCode::Validation, "replay script must be a JSON array");
    }

    std::vector<LlmResponse> script;
    for (const auto& entry : j) {
      script.push_back(LlmResponse::from_json(entry));
    }
    spdlog::debug("[ReplayProvider] Loaded {} responses from {}", script.size(), path.string());
    return R::success(std::make_shared<ReplayProvider>(std::move(script), latency));
  } catch (const json::exception& e) {
    return R::failure(ErrorCode::Validation, std::string("invalid replay script: ") + e.what());
  }
}

std::future<LlmResponse> ReplayProvider::complete(const LlmRequest& request, const ExecContext& /* ctx */) {
  std::optional<LlmResponse> response;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_ < script_.size()) {
      response = script_[next_];
    }
    ++next_;
  }

  spdlog::trace("[ReplayProvider] Request for {} with {} messages", request.subagent_id, request.messages.size());

  auto latency = latency_;
  return std::async(std::launch::async, [response = std::move(response), latency]() -> LlmResponse {
    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }
    if (!response) {
      return LlmResponse::failure("replay script exhausted");
    }
    return *response;
  });
}

size_t ReplayProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_;
}

size_t ReplayProvider::remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_ < script_.size() ? script_.size() - next_ : 0;
}

}  // namespace subagent::llm
