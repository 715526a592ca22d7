#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "subagent/types.hpp"
#include "types.hpp"

namespace subagent {

// Per-skill defaults applied when a subagent is spawned for that skill
struct SkillProfile {
  std::string name;
  std::string system_prompt;

  // nullopt = all tools
  ToolAllowlist allowed_tools;

  // nullopt = SubagentSettings::default_limits
  std::optional<ResourceLimits> limits;
};

// Supervisor and executor settings
struct SubagentSettings {
  ResourceLimits default_limits = ResourceLimits::defaults();

  // Hard ceiling on loop iterations, independent of the budget
  int max_iterations = 50;

  // Admission cap on concurrently running subagents (0 = unbounded)
  size_t max_concurrent = 0;

  // Threads executing subagents in the background
  size_t worker_threads = 8;

  std::chrono::milliseconds shutdown_timeout{5000};
  std::chrono::milliseconds shutdown_poll_interval{50};
};

// Application configuration
struct Config {
  SubagentSettings subagent;

  // Skill profiles keyed by skill name
  std::map<std::string, SkillProfile> skills;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file. Missing or malformed files yield defaults.
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: SUBAGENT_MAX_TOKENS, SUBAGENT_MAX_TOOL_CALLS, SUBAGENT_TIMEOUT_MS,
  //        SUBAGENT_MAX_ITERATIONS, SUBAGENT_MAX_CONCURRENT, SUBAGENT_WORKER_THREADS,
  //        SUBAGENT_LOG_LEVEL, SUBAGENT_LOG_FILE
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Get skill profile
  std::optional<SkillProfile> get_skill(const std::string& name) const;

  // Profile for a skill, falling back to unrestricted tools and default limits
  SkillProfile get_or_create_skill(const std::string& name) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace subagent
