#include "tool/tool.hpp"

#include <spdlog/spdlog.h>

namespace subagent {

namespace {

// JSON Schema type check; unknown type names accept anything
bool matches_type(const json &value, const std::string &type) {
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  return true;
}

}  // namespace

std::future<ToolResult> ready_result(ToolResult result) {
  std::promise<ToolResult> promise;
  promise.set_value(std::move(result));
  return promise.get_future();
}

// Parameter schema to JSON
json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

// Tool to JSON schema
json Tool::to_json_schema() const {
  json schema;
  schema["name"] = id();
  schema["description"] = description();

  json properties = json::object();
  json required_props = json::array();

  for (const auto &param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  schema["input_schema"] = {{"type", "object"}, {"properties", properties}, {"required", required_props}};

  return schema;
}

Result<json> Tool::validate_args(const json &args) const {
  if (!args.is_object()) {
    return Result<json>::failure(ErrorCode::Validation, "Arguments must be a JSON object");
  }

  for (const auto &param : parameters()) {
    if (!args.contains(param.name)) {
      if (param.required) {
        return Result<json>::failure(ErrorCode::Validation, "Missing required parameter: " + param.name);
      }
      continue;
    }
    if (!matches_type(args[param.name], param.type)) {
      return Result<json>::failure(ErrorCode::Validation, "Parameter " + param.name + " must be of type " + param.type);
    }
  }

  return Result<json>::success(args);
}

// SimpleTool implementation
SimpleTool::SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

// Tool Registry
void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  std::lock_guard lock(mutex_);
  spdlog::debug("[ToolRegistry] Registering tool: {}", tool->id());
  tools_[tool->id()] = std::move(tool);
}

void ToolRegistry::unregister_tool(const std::string &id) {
  std::lock_guard lock(mutex_);
  tools_.erase(id);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto &[id, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::for_allowlist(const ToolAllowlist &allowed_tools) const {
  std::vector<std::shared_ptr<Tool>> result;
  for (const auto &tool : all()) {
    if (is_tool_allowed(tool->id(), allowed_tools)) {
      result.push_back(tool);
    }
  }
  return result;
}

void ToolRegistry::set_caller_id(ContextId caller_id) {
  std::lock_guard lock(mutex_);
  caller_id_ = std::move(caller_id);
}

std::future<ToolResult> ToolRegistry::execute(const ExecContext &ctx, const std::string &tool_name, const json &args) {
  auto tool = get(tool_name);
  if (!tool) {
    spdlog::warn("[ToolRegistry] Unknown tool: {}", tool_name);
    return ready_result(ToolResult::error("unknown tool: " + tool_name));
  }

  auto validated = tool->validate_args(args);
  if (!validated.ok()) {
    return ready_result(ToolResult::error(validated.error->message));
  }

  ToolContext tool_ctx;
  {
    std::lock_guard lock(mutex_);
    tool_ctx.caller_id = caller_id_;
  }
  tool_ctx.exec_ctx = ctx;

  spdlog::debug("[ToolRegistry] Executing {} with args {}", tool_name, args.dump());
  return tool->execute(*validated.value, tool_ctx);
}

}  // namespace subagent
