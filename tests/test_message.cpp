#include <gtest/gtest.h>

#include "core/message.hpp"

using namespace codeloop;

TEST(MessageTest, UserMessageText) {
  auto msg = Message::user("Hello");
  EXPECT_EQ(msg.role(), Role::User);
  EXPECT_EQ(msg.text(), "Hello");
  EXPECT_FALSE(msg.has_tool_calls());
  EXPECT_FALSE(msg.id().empty());
}

TEST(MessageTest, ReasoningIsKeptApartFromText) {
  Message msg(Role::Assistant, "");
  msg.add_reasoning("let me think");
  msg.add_text("final answer");

  EXPECT_EQ(msg.text(), "final answer");
  ASSERT_TRUE(msg.reasoning().has_value());
  EXPECT_EQ(*msg.reasoning(), "let me think");

  // 空的 reasoning 不记录
  Message plain(Role::Assistant, "x");
  plain.add_reasoning("");
  EXPECT_FALSE(plain.reasoning().has_value());
}

TEST(MessageTest, ToolCallsKeepEmissionOrder) {
  Message msg(Role::Assistant, "");
  msg.add_tool_call("call_1", "read_file", {{"path", "a.txt"}});
  msg.add_tool_call("call_2", "grep_files", {{"pattern", "x"}});

  auto calls = msg.tool_calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0]->id, "call_1");
  EXPECT_EQ(calls[1]->id, "call_2");
  EXPECT_EQ(calls[0]->arguments["path"], "a.txt");
}

TEST(MessageTest, ToolResultBackReference) {
  auto msg = Message::tool_result("call_9", "read_file", "contents", true, {{"error_kind", "timeout"}});
  EXPECT_EQ(msg.role(), Role::Tool);
  EXPECT_EQ(msg.tool_call_id(), "call_9");
  ASSERT_NE(msg.tool_result(), nullptr);
  EXPECT_TRUE(msg.tool_result()->is_error);
  EXPECT_EQ(msg.tool_result()->metadata["error_kind"], "timeout");

  EXPECT_EQ(Message::user("x").tool_result(), nullptr);
  EXPECT_EQ(Message::user("x").tool_call_id(), "");
}

TEST(MessageTest, JsonSerialization) {
  Message msg(Role::Assistant, "");
  msg.add_reasoning("thinking");
  msg.add_text("answer");
  msg.add_tool_call("call_1", "write_file", {{"path", "out.txt"}, {"content", "hi"}});
  msg.set_finish_reason(FinishReason::ToolCalls);
  msg.set_synthetic(true);
  TokenUsage usage;
  usage.input_tokens = 12;
  usage.output_tokens = 3;
  msg.set_usage(usage);

  auto restored = Message::from_json(msg.to_json());

  EXPECT_EQ(restored.id(), msg.id());
  EXPECT_EQ(restored.role(), Role::Assistant);
  EXPECT_EQ(restored.text(), "answer");
  EXPECT_EQ(restored.reasoning().value_or(""), "thinking");
  EXPECT_EQ(restored.finish_reason(), FinishReason::ToolCalls);
  EXPECT_TRUE(restored.is_synthetic());
  EXPECT_EQ(restored.usage().total(), 15);
  ASSERT_EQ(restored.tool_calls().size(), 1u);
  EXPECT_EQ(restored.tool_calls()[0]->arguments["content"], "hi");
}

TEST(MessageTest, RoleStrings) {
  EXPECT_EQ(to_string(Role::Tool), "tool");
  EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
  EXPECT_EQ(role_from_string("bogus"), Role::User);
}

TEST(TypesTest, FinishReasonStrings) {
  EXPECT_EQ(finish_reason_from_string("tool_calls"), FinishReason::ToolCalls);
  EXPECT_EQ(finish_reason_from_string("tool_use"), FinishReason::ToolCalls);
  EXPECT_EQ(finish_reason_from_string("end_turn"), FinishReason::Stop);
  EXPECT_EQ(finish_reason_from_string("max_tokens"), FinishReason::Length);
}

TEST(TypesTest, SanitizeUtf8ReplacesInvalidBytes) {
  std::string bad = "ok\xff";
  auto clean = sanitize_utf8(bad);
  EXPECT_EQ(clean.substr(0, 2), "ok");
  EXPECT_EQ(clean.substr(2), "\xEF\xBF\xBD");
}
