#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace subagent {

// Message role
enum class Role { System, User, Assistant };

std::string to_string(Role role);

Role role_from_string(const std::string &str);

// One conversation turn. Plain value type: copying a history copies every turn.
struct ChatMessage {
  Role role = Role::User;
  std::string content;

  // Factory methods
  static ChatMessage system(const std::string &content);
  static ChatMessage user(const std::string &content);
  static ChatMessage assistant(const std::string &content);

  bool operator==(const ChatMessage &other) const = default;

  // Serialization
  json to_json() const;
  static ChatMessage from_json(const json &j);
};

using Conversation = std::vector<ChatMessage>;

json to_json(const Conversation &conversation);

}  // namespace subagent
