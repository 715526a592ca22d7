#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "subagent/subagent.hpp"

using namespace subagent;

static ExecContext g_cancel_all = ExecContext::with_cancel(ExecContext::background());

static void sigint_handler(int) {
  // Only flips an atomic; the main loop does the cancelling
  g_cancel_all.cancel();
}

// Records notes the subagent takes while working
class NoteTool : public SimpleTool {
 public:
  NoteTool() : SimpleTool("note", "Write down an intermediate finding") {}

  std::vector<ParameterSchema> parameters() const override {
    return {{"text", "string", "The finding to record", true, std::nullopt, std::nullopt}};
  }

  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override {
    auto text = args["text"].get<std::string>();
    std::cout << "[" << ctx.caller_id << "] note: " << text << "\n";
    return ready_result(ToolResult::success("noted (" + std::to_string(text.size()) + " chars)"));
  }
};

// Script used when no replay file is given
static std::vector<llm::LlmResponse> builtin_script() {
  return {
      llm::LlmResponse::from_json({{"content", "Recording what I found."},
                                   {"finish_reason", "tool_use"},
                                   {"tool_calls", {{{"id", "call_1"}, {"name", "note"}, {"input", {{"text", "asio pools are fixed size"}}}}}},
                                   {"usage", {{"input_tokens", 120}, {"output_tokens", 30}}}}),
      llm::LlmResponse::from_json({{"content", "Use a bounded thread pool with an admission cap."},
                                   {"finish_reason", "end_turn"},
                                   {"usage", {{"input_tokens", 180}, {"output_tokens", 25}}}}),
  };
}

int main(int argc, char* argv[]) {
  auto config = Config::from_env();
  init(config);

  std::shared_ptr<llm::Provider> provider;
  if (argc > 1) {
    auto loaded = llm::ReplayProvider::load(argv[1], std::chrono::milliseconds(200));
    if (!loaded.ok()) {
      std::cerr << "Error: " << loaded.error->describe() << "\n";
      return 1;
    }
    provider = *loaded.value;
  } else {
    provider = std::make_shared<llm::ReplayProvider>(builtin_script(), std::chrono::milliseconds(200));
  }

  auto runtime = make_runtime(provider, config);
  runtime.tools->register_tool(std::make_shared<NoteTool>());

  std::signal(SIGINT, sigint_handler);

  runtime.manager->set_monitoring_hook([](const SubagentId& id, SubagentStatus status) {
    std::cout << "[monitor] " << id << " -> " << to_string(status) << "\n";
  });

  std::cout << "subagent-sdk " << version() << "\n\n";

  Conversation parent_history = {
      ChatMessage::system("You are a planning assistant."),
      ChatMessage::user("How should we run background workers?"),
      ChatMessage::assistant("Let me delegate the research."),
  };
  parent_history.push_back(ChatMessage::user("Research thread pool options and summarize."));

  auto skill = config.get_or_create_skill("research");
  ToolAllowlist allowed = skill.allowed_tools.value_or(std::vector<std::string>{"note"});

  auto forked = runtime.forker.fork("conversation-1", parent_history, skill.name, allowed, *skill.limits);
  if (!forked.ok()) {
    std::cerr << "Error: " << forked.error->describe() << "\n";
    return 1;
  }
  auto id = forked.value->id;

  auto started = runtime.manager->start(ExecContext::background(), *forked.value);
  if (!started.ok()) {
    std::cerr << "Error: " << started.error->describe() << "\n";
    return 1;
  }

  while (!runtime.manager->list_running(ExecContext::background()).empty()) {
    if (g_cancel_all.done()) {
      std::cout << "\n[Interrupted]\n";
      auto cancelled = runtime.manager->cancel(ExecContext::background(), id);
      if (!cancelled.ok()) {
        std::cerr << "Error: " << cancelled.error->describe() << "\n";
      }
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  auto status = runtime.manager->get_status(ExecContext::background(), id);
  if (status.ok()) {
    std::cout << "\n" << status.value->to_json().dump(2) << "\n";
  }

  auto stopped = runtime.manager->shutdown(ExecContext::with_timeout(ExecContext::background(), std::chrono::seconds(2)));
  if (!stopped.ok()) {
    std::cerr << "Shutdown: " << stopped.error->describe() << "\n";
  }

  shutdown();
  return status.ok() && status.value->status == SubagentStatus::Complete ? 0 : 1;
}
