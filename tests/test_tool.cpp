#include <gtest/gtest.h>

#include "fakes.hpp"
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

using namespace subagent;
using namespace subagent::fakes;
using namespace std::chrono_literals;

namespace {

class EchoTool : public SimpleTool {
 public:
  EchoTool() : SimpleTool("echo", "Echo the text back") {}

  std::vector<ParameterSchema> parameters() const override {
    return {{"text", "string", "Text to echo", true, std::nullopt, std::nullopt},
            {"loud", "boolean", "Upper-case the reply", false, json(false), std::nullopt}};
  }

  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override {
    return ready_result(ToolResult::success(ctx.caller_id + ": " + args["text"].get<std::string>()));
  }
};

}  // namespace

// --- ToolRegistryTest ---

TEST(ToolRegistryTest, RegisterAndLookup) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  auto echo = registry.get("echo");
  ASSERT_NE(echo, nullptr);
  EXPECT_EQ(echo->id(), "echo");
  EXPECT_EQ(registry.all().size(), 1u);

  registry.unregister_tool("echo");
  EXPECT_EQ(registry.get("echo"), nullptr);
}

TEST(ToolRegistryTest, JsonSchema) {
  EchoTool tool;
  auto schema = tool.to_json_schema();

  EXPECT_EQ(schema["name"], "echo");
  EXPECT_TRUE(schema.contains("description"));
  EXPECT_EQ(schema["input_schema"]["required"], json::array({"text"}));
  EXPECT_EQ(schema["input_schema"]["properties"]["loud"]["default"], false);
}

TEST(ToolRegistryTest, ExecuteByName) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());
  registry.set_caller_id("conv-1");

  auto result = registry.execute(ExecContext::background(), "echo", {{"text", "hi"}}).get();
  EXPECT_FALSE(result.is_error);
  EXPECT_EQ(result.output, "conv-1: hi");
}

TEST(ToolRegistryTest, UnknownToolIsError) {
  ToolRegistry registry;
  auto result = registry.execute(ExecContext::background(), "missing", json::object()).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.output, "unknown tool: missing");
}

TEST(ToolRegistryTest, MissingRequiredParameter) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  auto result = registry.execute(ExecContext::background(), "echo", json::object()).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.output, "Missing required parameter: text");

  auto not_object = registry.execute(ExecContext::background(), "echo", json::array()).get();
  EXPECT_TRUE(not_object.is_error);
}

TEST(ToolRegistryTest, WrongParameterType) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  auto result = registry.execute(ExecContext::background(), "echo", {{"text", 1}}).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.output, "Parameter text must be of type string");

  auto optional_bad = registry.execute(ExecContext::background(), "echo", {{"text", "hi"}, {"loud", "yes"}}).get();
  EXPECT_TRUE(optional_bad.is_error);
  EXPECT_EQ(optional_bad.output, "Parameter loud must be of type boolean");
}

TEST(ToolRegistryTest, ForAllowlist) {
  ToolRegistry registry;
  registry.register_tool(std::make_shared<EchoTool>());

  EXPECT_EQ(registry.for_allowlist(std::nullopt).size(), 1u);
  EXPECT_TRUE(registry.for_allowlist(std::vector<std::string>{}).empty());
  EXPECT_EQ(registry.for_allowlist(std::vector<std::string>{"echo", "other"}).size(), 1u);
}

// --- SubagentToolsTest ---

class SubagentToolsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    executor_ = std::make_shared<SleepyExecutor>([this](const ExecContext& ctx, const SubagentContext& sc) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        seen_.push_back(sc);
      }
      while (!ctx.done() && !release_) {
        std::this_thread::sleep_for(5ms);
      }
      SubagentResult r;
      r.subagent_id = sc.id;
      r.status = SubagentStatus::Complete;
      r.output = "finished " + sc.skill_name;
      return Result<SubagentResult>::success(r);
    });
    manager_ = std::make_shared<LifecycleManager>(executor_);

    config_.skills["research"] =
        SkillProfile{"research", "You research.", std::vector<std::string>{"search"}, ResourceLimits{500, 3, 2000ms}};

    registry_.set_caller_id("conv-1");
    tools::register_builtins(registry_, manager_, config_);
  }

  void TearDown() override {
    release_ = true;
  }

  std::string spawn(const json& args) {
    auto result = registry_.execute(ExecContext::background(), "spawn_subagent", args).get();
    EXPECT_FALSE(result.is_error) << result.output;
    return json::parse(result.output)["subagent_id"].get<std::string>();
  }

  SubagentContext last_seen() {
    EXPECT_TRUE(wait_until([this] {
      std::lock_guard<std::mutex> lock(mu_);
      return !seen_.empty();
    }));
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.back();
  }

  std::atomic<bool> release_{false};
  std::mutex mu_;
  std::vector<SubagentContext> seen_;
  std::shared_ptr<SleepyExecutor> executor_;
  std::shared_ptr<LifecycleManager> manager_;
  Config config_;
  ToolRegistry registry_;
};

TEST_F(SubagentToolsTest, BuiltinsRegistered) {
  EXPECT_NE(registry_.get("spawn_subagent"), nullptr);
  EXPECT_NE(registry_.get("subagent_status"), nullptr);
  EXPECT_NE(registry_.get("cancel_subagent"), nullptr);
}

TEST_F(SubagentToolsTest, SpawnUsesSkillProfile) {
  auto result = registry_.execute(ExecContext::background(), "spawn_subagent", {{"prompt", "Find papers"}, {"skill", "research"}}).get();
  ASSERT_FALSE(result.is_error) << result.output;
  ASSERT_TRUE(result.title.has_value());
  EXPECT_EQ(*result.title, "Subagent: research");

  auto out = json::parse(result.output);
  EXPECT_EQ(out["status"], "running");
  auto id = out["subagent_id"].get<std::string>();
  EXPECT_TRUE(id.starts_with("subagent-"));

  auto ctx = last_seen();
  EXPECT_EQ(ctx.id, id);
  EXPECT_EQ(ctx.parent_context_id, "conv-1");
  ASSERT_EQ(ctx.conversation_history.size(), 2u);
  EXPECT_EQ(ctx.conversation_history[0], ChatMessage::system("You research."));
  EXPECT_EQ(ctx.conversation_history[1], ChatMessage::user("Find papers"));
  EXPECT_TRUE(ctx.allowed_tools == (ToolAllowlist{std::vector<std::string>{"search"}}));
  EXPECT_EQ(ctx.limits.max_tokens, 500);
  EXPECT_EQ(ctx.limits.timeout, 2000ms);
}

TEST_F(SubagentToolsTest, SpawnArgumentsOverrideProfile) {
  spawn({{"prompt", "p"},
         {"skill", "research"},
         {"parent_context_id", "conv-9"},
         {"allowed_tools", json::array()},
         {"max_tokens", 99},
         {"timeout_ms", 300}});

  auto ctx = last_seen();
  EXPECT_EQ(ctx.parent_context_id, "conv-9");
  ASSERT_TRUE(ctx.allowed_tools.has_value());
  EXPECT_TRUE(ctx.allowed_tools->empty());
  EXPECT_EQ(ctx.limits.max_tokens, 99);
  EXPECT_EQ(ctx.limits.max_tool_calls, 3);
  EXPECT_EQ(ctx.limits.timeout, 300ms);
}

TEST_F(SubagentToolsTest, SpawnUnknownSkillUsesDefaults) {
  spawn({{"prompt", "p"}, {"skill", "adhoc"}});

  auto ctx = last_seen();
  EXPECT_FALSE(ctx.allowed_tools.has_value());
  EXPECT_EQ(ctx.conversation_history.size(), 1u);
  EXPECT_EQ(ctx.limits.max_tokens, ResourceLimits::defaults().max_tokens);
}

TEST_F(SubagentToolsTest, SpawnRejectsEmptySkill) {
  auto result = registry_.execute(ExecContext::background(), "spawn_subagent", {{"prompt", "p"}, {"skill", ""}}).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_NE(result.output.find("skill name is required"), std::string::npos);
}

TEST_F(SubagentToolsTest, SpawnMistypedArgumentsReturnError) {
  std::vector<json> bad_args = {
      {{"prompt", 1}, {"skill", "research"}},
      {{"prompt", "p"}, {"skill", "research"}, {"timeout_ms", "5s"}},
      {{"prompt", "p"}, {"skill", "research"}, {"max_tokens", "many"}},
      {{"prompt", "p"}, {"skill", "research"}, {"allowed_tools", "search"}},
  };
  for (const auto& args : bad_args) {
    ToolResult result;
    EXPECT_NO_THROW(result = registry_.execute(ExecContext::background(), "spawn_subagent", args).get()) << args.dump();
    EXPECT_TRUE(result.is_error) << args.dump();
  }

  // 数组元素类型错误由工具本身拦截
  auto spawn = registry_.get("spawn_subagent");
  ToolContext tool_ctx;
  json mixed = {{"prompt", "p"}, {"skill", "research"}, {"allowed_tools", json::array({1})}};
  ToolResult elements;
  EXPECT_NO_THROW(elements = spawn->execute(mixed, tool_ctx).get());
  EXPECT_TRUE(elements.is_error);
  EXPECT_TRUE(elements.output.starts_with("Invalid spawn_subagent arguments"));

  EXPECT_EQ(manager_->size(), 0u);
}

TEST_F(SubagentToolsTest, StatusAndCancel) {
  auto id = spawn({{"prompt", "p"}, {"skill", "research"}});

  auto status = registry_.execute(ExecContext::background(), "subagent_status", {{"subagent_id", id}}).get();
  ASSERT_FALSE(status.is_error);
  EXPECT_EQ(json::parse(status.output)["status"], "running");

  auto cancelled = registry_.execute(ExecContext::background(), "cancel_subagent", {{"subagent_id", id}}).get();
  ASSERT_FALSE(cancelled.is_error);
  EXPECT_EQ(json::parse(cancelled.output)["status"], "cancelled");

  auto unknown = registry_.execute(ExecContext::background(), "subagent_status", {{"subagent_id", "nope"}}).get();
  EXPECT_TRUE(unknown.is_error);
  EXPECT_EQ(unknown.output, "subagent nope not found");
}

TEST_F(SubagentToolsTest, SpawnedSubagentOutlivesCaller) {
  auto caller = ExecContext::with_cancel(ExecContext::background());
  auto result = registry_.execute(caller, "spawn_subagent", {{"prompt", "p"}, {"skill", "research"}}).get();
  ASSERT_FALSE(result.is_error);
  auto id = json::parse(result.output)["subagent_id"].get<std::string>();

  caller.cancel();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(manager_->get_status(ExecContext::background(), id).value->status, SubagentStatus::Running);

  release_ = true;
  EXPECT_TRUE(wait_until([&] { return manager_->get_status(ExecContext::background(), id).value->status == SubagentStatus::Complete; }));
}

TEST(SubagentToolsLifetimeTest, ManagerGone) {
  ToolRegistry registry;
  {
    auto manager = std::make_shared<LifecycleManager>(std::make_shared<SleepyExecutor>(0ms));
    tools::register_builtins(registry, manager, Config{});
  }

  auto result = registry.execute(ExecContext::background(), "spawn_subagent", {{"prompt", "p"}, {"skill", "s"}}).get();
  EXPECT_TRUE(result.is_error);
}
