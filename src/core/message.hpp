#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"
#include "core/uuid.hpp"

namespace codeloop {

// Message part types
struct TextPart {
  std::string text;
};

// Model "thinking" output, kept apart from the answer text
struct ReasoningPart {
  std::string text;
};

struct ToolCallPart {
  std::string id;
  std::string name;
  json arguments;  // keyed object, or the raw payload when the model sent garbage
};

struct ToolResultPart {
  std::string tool_call_id;
  std::string tool_name;
  std::string output;
  bool is_error = false;

  json metadata = json::object();
};

using MessagePart = std::variant<TextPart, ReasoningPart, ToolCallPart, ToolResultPart>;

// Message role
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);
Role role_from_string(const std::string &str);

// Message class
class Message {
 public:
  Message() = default;
  Message(Role role, const std::string &content);

  // Factory methods
  static Message system(const std::string &content);
  static Message user(const std::string &content);
  static Message assistant(const std::string &content);
  static Message tool_result(const std::string &call_id, const std::string &tool_name, const std::string &output, bool is_error = false,
                             const json &metadata = json::object());

  // Accessors
  const MessageId &id() const {
    return id_;
  }
  Role role() const {
    return role_;
  }
  const std::vector<MessagePart> &parts() const {
    return parts_;
  }

  FinishReason finish_reason() const {
    return finish_reason_;
  }
  void set_finish_reason(FinishReason reason) {
    finish_reason_ = reason;
  }

  // Token tracking
  const TokenUsage &usage() const {
    return usage_;
  }
  void set_usage(const TokenUsage &usage) {
    usage_ = usage;
  }

  // Synthetic flag (generated by the loop, not the model)
  bool is_synthetic() const {
    return is_synthetic_;
  }
  void set_synthetic(bool synthetic) {
    is_synthetic_ = synthetic;
  }

  // Part manipulation
  void add_text(const std::string &text);
  void add_reasoning(const std::string &text);
  void add_tool_call(const std::string &id, const std::string &name, const json &args);

  // Concatenated answer text, reasoning excluded
  std::string text() const;

  // Concatenated reasoning, nullopt when the model sent none
  std::optional<std::string> reasoning() const;

  std::vector<const ToolCallPart *> tool_calls() const;
  bool has_tool_calls() const;

  // Only set on Role::Tool messages
  const ToolResultPart *tool_result() const;
  std::string tool_call_id() const;

  // Serialization
  json to_json() const;
  static Message from_json(const json &j);

 private:
  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  std::vector<MessagePart> parts_;

  FinishReason finish_reason_ = FinishReason::Stop;
  TokenUsage usage_;
  bool is_synthetic_ = false;
};

}  // namespace codeloop
