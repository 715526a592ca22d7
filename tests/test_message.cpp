#include <gtest/gtest.h>

#include "core/message.hpp"

using namespace subagent;

TEST(MessageTest, Factories) {
  auto sys = ChatMessage::system("You are helpful");
  EXPECT_EQ(sys.role, Role::System);
  EXPECT_EQ(sys.content, "You are helpful");

  EXPECT_EQ(ChatMessage::user("Hello").role, Role::User);
  EXPECT_EQ(ChatMessage::assistant("Hi").role, Role::Assistant);
}

TEST(MessageTest, Serialization) {
  auto msg = ChatMessage::assistant("done");
  auto j = msg.to_json();

  EXPECT_EQ(j["role"], "assistant");
  EXPECT_EQ(j["content"], "done");
  EXPECT_EQ(ChatMessage::from_json(j), msg);
}

TEST(MessageTest, UnknownRoleFallsBackToUser) {
  auto msg = ChatMessage::from_json({{"role", "tool"}, {"content", "x"}});
  EXPECT_EQ(msg.role, Role::User);
}

TEST(MessageTest, ConversationCopyIsIndependent) {
  Conversation original = {ChatMessage::system("s"), ChatMessage::user("u")};
  Conversation copy = original;

  copy[1].content = "changed";
  copy.push_back(ChatMessage::assistant("a"));

  EXPECT_EQ(original.size(), 2u);
  EXPECT_EQ(original[1].content, "u");
}

TEST(MessageTest, ConversationToJson) {
  Conversation conv = {ChatMessage::user("a"), ChatMessage::assistant("b")};
  auto j = to_json(conv);

  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[1]["role"], "assistant");
}
