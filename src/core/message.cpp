#include "core/message.hpp"

namespace subagent {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

ChatMessage ChatMessage::system(const std::string &content) {
  return ChatMessage{Role::System, content};
}

ChatMessage ChatMessage::user(const std::string &content) {
  return ChatMessage{Role::User, content};
}

ChatMessage ChatMessage::assistant(const std::string &content) {
  return ChatMessage{Role::Assistant, content};
}

json ChatMessage::to_json() const {
  return json{{"role", subagent::to_string(role)}, {"content", content}};
}

ChatMessage ChatMessage::from_json(const json &j) {
  ChatMessage msg;
  msg.role = role_from_string(j.value("role", "user"));
  msg.content = j.value("content", "");
  return msg;
}

json to_json(const Conversation &conversation) {
  json arr = json::array();
  for (const auto &msg : conversation) {
    arr.push_back(msg.to_json());
  }
  return arr;
}

}  // namespace subagent
