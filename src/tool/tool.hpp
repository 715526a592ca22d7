#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/types.hpp"
#include "subagent/types.hpp"

namespace subagent {

// Tool execution context
struct ToolContext {
  // Conversation (or subagent) on whose behalf the tool runs
  ContextId caller_id;

  // Cancellation and deadline of the caller
  ExecContext exec_ctx;

  // Progress callback
  std::function<void(const std::string& status)> on_progress;
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata;
  bool is_error = false;

  // Factory methods
  static ToolResult success(const std::string& output) {
    return ToolResult{output, std::nullopt, json::object(), false};
  }

  static ToolResult error(const std::string& message) {
    return ToolResult{message, std::nullopt, json::object(), true};
  }

  static ToolResult with_title(const std::string& output, const std::string& title) {
    return ToolResult{output, title, json::object(), false};
  }
};

// Already-satisfied future, for tools that finish synchronously
std::future<ToolResult> ready_result(ToolResult result);

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "integer", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  // Tool identification
  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  // Parameter schema
  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Execution
  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // Generate JSON Schema for tool
  json to_json_schema() const;

  // Validate arguments
  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Narrow interface through which the executor runs tools by name.
// A result with is_error set is treated as a tool failure.
class ToolExecutor {
 public:
  virtual ~ToolExecutor() = default;

  virtual std::future<ToolResult> execute(const ExecContext& ctx, const std::string& tool_name, const json& args) = 0;
};

// Tool registry. Each owner constructs its own; there is no process-wide instance.
class ToolRegistry : public ToolExecutor {
 public:
  ToolRegistry() = default;

  // Register a tool, replacing any tool with the same ID
  void register_tool(std::shared_ptr<Tool> tool);

  // Unregister a tool
  void unregister_tool(const std::string& id);

  // Get a tool by ID
  std::shared_ptr<Tool> get(const std::string& id) const;

  // Get all tools
  std::vector<std::shared_ptr<Tool>> all() const;

  // Tools visible under an allowlist
  std::vector<std::shared_ptr<Tool>> for_allowlist(const ToolAllowlist& allowed_tools) const;

  // Caller ID handed to tools run through the ToolExecutor interface
  void set_caller_id(ContextId caller_id);

  std::future<ToolResult> execute(const ExecContext& ctx, const std::string& tool_name, const json& args) override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
  ContextId caller_id_;
};

}  // namespace subagent
