#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace subagent {

namespace fs = std::filesystem;

namespace {

ToolAllowlist allowlist_from_json(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return std::nullopt;
  }
  std::vector<std::string> tools;
  for (const auto& tool : j[key]) {
    tools.push_back(tool.get<std::string>());
  }
  return tools;
}

// Returns the parsed value of an integer environment variable, if set and valid
std::optional<int64_t> env_int(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    int64_t value = std::stoll(raw, &consumed);
    if (consumed != std::string(raw).size()) {
      throw std::invalid_argument("trailing characters");
    }
    return value;
  } catch (const std::exception& e) {
    spdlog::warn("[Config] Ignoring {}={}: {}", name, raw, e.what());
    return std::nullopt;
  }
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    // Load subagent settings
    if (j.contains("subagent")) {
      const auto& s = j["subagent"];
      auto& settings = config.subagent;
      if (s.contains("default_limits")) {
        settings.default_limits = ResourceLimits::from_json(s["default_limits"], settings.default_limits);
      }
      settings.max_iterations = s.value("max_iterations", settings.max_iterations);
      if (auto v = s.value("max_concurrent", static_cast<int64_t>(settings.max_concurrent)); v >= 0) {
        settings.max_concurrent = static_cast<size_t>(v);
      } else {
        spdlog::warn("[Config] Ignoring negative subagent.max_concurrent={}", v);
      }
      if (s.contains("worker_threads")) {
        auto v = s["worker_threads"].get<int64_t>();
        if (v > 0) {
          settings.worker_threads = static_cast<size_t>(v);
        } else {
          spdlog::warn("[Config] Ignoring non-positive subagent.worker_threads={}", v);
        }
      }
      settings.shutdown_timeout = std::chrono::milliseconds(s.value("shutdown_timeout_ms", static_cast<int64_t>(settings.shutdown_timeout.count())));
      settings.shutdown_poll_interval =
          std::chrono::milliseconds(s.value("shutdown_poll_interval_ms", static_cast<int64_t>(settings.shutdown_poll_interval.count())));
    }

    // Load skill profiles
    if (j.contains("skills")) {
      for (auto& [name, skill_json] : j["skills"].items()) {
        SkillProfile skill;
        skill.name = name;
        skill.system_prompt = skill_json.value("system_prompt", "");
        skill.allowed_tools = allowlist_from_json(skill_json, "allowed_tools");
        if (skill_json.contains("limits")) {
          skill.limits = ResourceLimits::from_json(skill_json["limits"], config.subagent.default_limits);
        }
        config.skills[name] = skill;
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("[Config] Failed to parse {}: {} (using defaults)", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();
  auto& settings = config.subagent;

  if (auto v = env_int("SUBAGENT_MAX_TOKENS")) settings.default_limits.max_tokens = *v;
  if (auto v = env_int("SUBAGENT_MAX_TOOL_CALLS")) settings.default_limits.max_tool_calls = static_cast<int>(*v);
  if (auto v = env_int("SUBAGENT_TIMEOUT_MS")) settings.default_limits.timeout = std::chrono::milliseconds(*v);
  if (auto v = env_int("SUBAGENT_MAX_ITERATIONS")) settings.max_iterations = static_cast<int>(*v);
  if (auto v = env_int("SUBAGENT_MAX_CONCURRENT"); v && *v >= 0) settings.max_concurrent = static_cast<size_t>(*v);
  if (auto v = env_int("SUBAGENT_WORKER_THREADS"); v && *v > 0) settings.worker_threads = static_cast<size_t>(*v);

  if (const char* level = std::getenv("SUBAGENT_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char* log_file = std::getenv("SUBAGENT_LOG_FILE")) {
    config.log_file = fs::path(log_file);
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["subagent"] = {{"default_limits", subagent.default_limits.to_json()},
                   {"max_iterations", subagent.max_iterations},
                   {"max_concurrent", subagent.max_concurrent},
                   {"worker_threads", subagent.worker_threads},
                   {"shutdown_timeout_ms", subagent.shutdown_timeout.count()},
                   {"shutdown_poll_interval_ms", subagent.shutdown_poll_interval.count()}};

  // Save skills
  json skills_json = json::object();
  for (const auto& [name, skill] : skills) {
    json s;
    s["system_prompt"] = skill.system_prompt;
    s["allowed_tools"] = skill.allowed_tools ? json(*skill.allowed_tools) : json(nullptr);
    if (skill.limits) {
      s["limits"] = skill.limits->to_json();
    }
    skills_json[name] = s;
  }
  j["skills"] = skills_json;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  } else {
    spdlog::warn("[Config] Cannot write {}", path.string());
  }
}

std::optional<SkillProfile> Config::get_skill(const std::string& name) const {
  auto it = skills.find(name);
  if (it != skills.end()) {
    return it->second;
  }
  return std::nullopt;
}

SkillProfile Config::get_or_create_skill(const std::string& name) const {
  auto profile = get_skill(name).value_or(SkillProfile{name, "", std::nullopt, std::nullopt});
  if (!profile.limits) {
    profile.limits = subagent.default_limits;
  }
  return profile;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "subagent-sdk";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".subagent-sdk" / "config.json";
}

}  // namespace config_paths

}  // namespace subagent
