#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "llm/replay.hpp"

using namespace subagent;
using namespace subagent::llm;

namespace fs = std::filesystem;

// --- LlmResponseTest ---

TEST(LlmResponseTest, FromAnthropicStyleJson) {
  auto r = LlmResponse::from_json({{"content", "looking"},
                                   {"finish_reason", "tool_use"},
                                   {"tool_calls", {{{"id", "t1"}, {"name", "search"}, {"input", {{"q", "x"}}}}}},
                                   {"usage", {{"input_tokens", 12}, {"output_tokens", 3}}}});

  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.finish_reason, FinishReason::ToolCalls);
  ASSERT_EQ(r.tool_calls.size(), 1u);
  EXPECT_EQ(r.tool_calls[0].name, "search");
  EXPECT_EQ(r.tool_calls[0].arguments["q"], "x");
  EXPECT_EQ(r.usage.total(), 15);
  EXPECT_FALSE(r.is_final());
}

TEST(LlmResponseTest, FinishReasonInferred) {
  EXPECT_EQ(LlmResponse::from_json({{"content", "hi"}}).finish_reason, FinishReason::Stop);
  auto with_tools = LlmResponse::from_json({{"tool_calls", {{{"tool_name", "fetch"}, {"arguments", json::object()}}}}});
  EXPECT_EQ(with_tools.finish_reason, FinishReason::ToolCalls);
  EXPECT_EQ(with_tools.tool_calls[0].name, "fetch");
}

TEST(LlmResponseTest, TotalOnlyUsage) {
  auto r = LlmResponse::from_json({{"content", "x"}, {"usage", {{"total_tokens", 40}}}});
  EXPECT_EQ(r.usage.total(), 40);
}

TEST(LlmResponseTest, StopWithToolCallsIsFinal) {
  LlmResponse r;
  r.finish_reason = FinishReason::Stop;
  r.tool_calls.push_back({"t1", "search", json::object()});
  EXPECT_TRUE(r.is_final());
}

TEST(LlmResponseTest, Failure) {
  auto r = LlmResponse::failure("down");
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(*r.error, "down");
  EXPECT_EQ(r.finish_reason, FinishReason::Error);
}

// --- ReplayProviderTest ---

TEST(ReplayProviderTest, AnswersInOrderThenExhausts) {
  LlmResponse first;
  first.content = "one";
  LlmResponse second;
  second.content = "two";
  ReplayProvider provider({first, second});

  LlmRequest request;
  EXPECT_EQ(provider.complete(request, ExecContext::background()).get().content, "one");
  EXPECT_EQ(provider.remaining(), 1u);
  EXPECT_EQ(provider.complete(request, ExecContext::background()).get().content, "two");

  auto exhausted = provider.complete(request, ExecContext::background()).get();
  EXPECT_FALSE(exhausted.ok());
  EXPECT_EQ(*exhausted.error, "replay script exhausted");
  EXPECT_EQ(provider.calls(), 3u);
  EXPECT_EQ(provider.remaining(), 0u);
}

TEST(ReplayProviderTest, LoadFromFile) {
  auto path = fs::temp_directory_path() / ("subagent_replay_" + std::to_string(::getpid()) + ".json");
  std::ofstream(path) << R"([
    {"content": "", "finish_reason": "tool_use", "tool_calls": [{"id": "1", "name": "search", "input": {}}]},
    {"content": "done", "finish_reason": "end_turn", "usage": {"input_tokens": 5, "output_tokens": 5}}
  ])";

  auto loaded = ReplayProvider::load(path);
  fs::remove(path);

  ASSERT_TRUE(loaded.ok()) << loaded.error->message;
  EXPECT_EQ((*loaded.value)->remaining(), 2u);
  EXPECT_EQ((*loaded.value)->name(), "replay");
}

TEST(ReplayProviderTest, LoadRejectsBadFiles) {
  EXPECT_EQ(ReplayProvider::load("/nonexistent/replay.json").error->code, ErrorCode::NotFound);

  auto path = fs::temp_directory_path() / ("subagent_replay_obj_" + std::to_string(::getpid()) + ".json");
  std::ofstream(path) << R"({"content": "not an array"})";
  auto loaded = ReplayProvider::load(path);
  fs::remove(path);

  ASSERT_FALSE(loaded.ok());
  EXPECT_EQ(loaded.error->code, ErrorCode::Validation);
}
