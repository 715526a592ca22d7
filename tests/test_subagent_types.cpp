#include <gtest/gtest.h>

#include "subagent/types.hpp"

using namespace subagent;
using namespace std::chrono_literals;

// --- SubagentStatusTest ---

TEST(SubagentStatusTest, TerminalStatuses) {
  EXPECT_FALSE(is_terminal(SubagentStatus::Pending));
  EXPECT_FALSE(is_terminal(SubagentStatus::Running));
  EXPECT_TRUE(is_terminal(SubagentStatus::Complete));
  EXPECT_TRUE(is_terminal(SubagentStatus::Error));
  EXPECT_TRUE(is_terminal(SubagentStatus::Timeout));
  EXPECT_TRUE(is_terminal(SubagentStatus::Cancelled));
}

TEST(SubagentStatusTest, StringConversion) {
  for (auto s : {SubagentStatus::Pending, SubagentStatus::Running, SubagentStatus::Complete, SubagentStatus::Error,
                 SubagentStatus::Timeout, SubagentStatus::Cancelled}) {
    auto parsed = subagent_status_from_string(to_string(s));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, s);
  }
  EXPECT_FALSE(subagent_status_from_string("paused").has_value());
}

// --- ResourceLimitsTest ---

TEST(ResourceLimitsTest, Defaults) {
  auto limits = ResourceLimits::defaults();
  EXPECT_EQ(limits.max_tokens, 100000);
  EXPECT_EQ(limits.max_tool_calls, 50);
  EXPECT_EQ(limits.timeout, 5min);
}

TEST(ResourceLimitsTest, BoundaryIsInclusive) {
  ResourceLimits limits{100, 5, 1000ms};

  EXPECT_TRUE(limits.is_within_limits(100, 5, 1000ms));
  EXPECT_FALSE(limits.is_within_limits(101, 5, 1000ms));
  EXPECT_FALSE(limits.is_within_limits(100, 6, 1000ms));
  EXPECT_FALSE(limits.is_within_limits(100, 5, 1001ms));
}

TEST(ResourceLimitsTest, ZeroMeansUnlimited) {
  ResourceLimits limits{0, 0, 1000ms};
  EXPECT_TRUE(limits.is_within_limits(1'000'000'000, 100000, 10ms));
}

TEST(ResourceLimitsTest, Validate) {
  EXPECT_TRUE(ResourceLimits::defaults().validate().ok());
  EXPECT_EQ(ResourceLimits({10, 1, 0ms}).validate().error->message, "timeout must be positive");
  EXPECT_EQ(ResourceLimits({-1, 1, 1ms}).validate().error->message, "max tokens must be non-negative");
  EXPECT_EQ(ResourceLimits({1, -1, 1ms}).validate().error->message, "max tool calls must be non-negative");
}

TEST(ResourceLimitsTest, FromJsonFallsBack) {
  auto limits = ResourceLimits::from_json({{"max_tokens", 42}});
  EXPECT_EQ(limits.max_tokens, 42);
  EXPECT_EQ(limits.max_tool_calls, 50);
  EXPECT_EQ(limits.timeout, 5min);
}

// --- AllowlistTest ---

TEST(AllowlistTest, AbsentAllowsEverything) {
  EXPECT_TRUE(is_tool_allowed("anything", std::nullopt));
  EXPECT_EQ(describe(std::nullopt), "all");
}

TEST(AllowlistTest, EmptyAllowsNothing) {
  ToolAllowlist none = std::vector<std::string>{};
  EXPECT_FALSE(is_tool_allowed("search", none));
  EXPECT_EQ(describe(none), "[]");
}

TEST(AllowlistTest, ExactMembership) {
  ToolAllowlist list = std::vector<std::string>{"search", "fetch"};
  EXPECT_TRUE(is_tool_allowed("fetch", list));
  EXPECT_FALSE(is_tool_allowed("Fetch", list));
  EXPECT_FALSE(is_tool_allowed("fetch_all", list));
  EXPECT_EQ(describe(list), "[search, fetch]");
}

// --- SubagentContextTest ---

TEST(SubagentContextTest, Validate) {
  SubagentContext ctx;
  ctx.id = "subagent-1";
  ctx.parent_context_id = "parent";
  ctx.skill_name = "research";
  ctx.limits = ResourceLimits::defaults();
  EXPECT_TRUE(ctx.validate().ok());

  auto no_id = ctx;
  no_id.id.clear();
  EXPECT_EQ(no_id.validate().error->message, "subagent context ID is required");

  auto no_parent = ctx;
  no_parent.parent_context_id.clear();
  EXPECT_EQ(no_parent.validate().error->message, "parent context ID is required");

  auto no_skill = ctx;
  no_skill.skill_name.clear();
  EXPECT_EQ(no_skill.validate().error->code, ErrorCode::Validation);
}

TEST(SubagentContextTest, ToJson) {
  SubagentContext ctx;
  ctx.id = "subagent-1";
  ctx.parent_context_id = "parent";
  ctx.skill_name = "research";
  ctx.limits = ResourceLimits::defaults();
  ctx.conversation_history = {ChatMessage::user("hi")};

  auto j = ctx.to_json();
  EXPECT_EQ(j["id"], "subagent-1");
  EXPECT_TRUE(j["allowed_tools"].is_null());
  EXPECT_EQ(j["limits"]["timeout_ms"], 300000);
  EXPECT_EQ(j["conversation_history"].size(), 1u);
}

// --- SubagentResultTest ---

TEST(SubagentResultTest, DefaultsToPending) {
  SubagentResult result;
  EXPECT_EQ(result.status, SubagentStatus::Pending);
  EXPECT_FALSE(result.completed_at.has_value());
}

TEST(SubagentResultTest, ErrorNeedsMessage) {
  SubagentResult result;
  result.subagent_id = "subagent-1";
  result.status = SubagentStatus::Error;
  EXPECT_FALSE(result.validate().ok());

  result.error_message = "LLM error: down";
  EXPECT_TRUE(result.validate().ok());
}

TEST(SubagentResultTest, ToJson) {
  SubagentResult result;
  result.subagent_id = "subagent-1";
  result.status = SubagentStatus::Complete;
  result.output = "done";
  result.step_results.push_back({1, "LLM call (finish: stop, tools: 0)", "done", 15, 3ms});

  auto j = result.to_json();
  EXPECT_EQ(j["status"], "complete");
  EXPECT_FALSE(j.contains("error_message"));
  EXPECT_FALSE(j.contains("completed_at"));
  ASSERT_EQ(j["step_results"].size(), 1u);
  EXPECT_EQ(j["step_results"][0]["tokens_used"], 15);
}
