#include "core/message.hpp"

namespace codeloop {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

Message::Message(Role role, const std::string &content) : role_(role) {
  if (!content.empty()) {
    parts_.push_back(TextPart{content});
  }
}

Message Message::system(const std::string &content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string &content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string &content) {
  return Message(Role::Assistant, content);
}

Message Message::tool_result(const std::string &call_id, const std::string &tool_name, const std::string &output, bool is_error,
                             const json &metadata) {
  Message msg;
  msg.role_ = Role::Tool;
  msg.parts_.push_back(ToolResultPart{call_id, tool_name, output, is_error, metadata.is_object() ? metadata : json::object()});
  return msg;
}

void Message::add_text(const std::string &text) {
  parts_.push_back(TextPart{text});
}

void Message::add_reasoning(const std::string &text) {
  if (!text.empty()) {
    parts_.push_back(ReasoningPart{text});
  }
}

void Message::add_tool_call(const std::string &id, const std::string &name, const json &args) {
  parts_.push_back(ToolCallPart{id, name, args});
}

std::string Message::text() const {
  std::string result;
  for (const auto &part : parts_) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    }
  }
  return result;
}

std::optional<std::string> Message::reasoning() const {
  std::optional<std::string> result;
  for (const auto &part : parts_) {
    if (auto *r = std::get_if<ReasoningPart>(&part)) {
      if (result) {
        *result += "\n" + r->text;
      } else {
        result = r->text;
      }
    }
  }
  return result;
}

std::vector<const ToolCallPart *> Message::tool_calls() const {
  std::vector<const ToolCallPart *> result;
  for (const auto &part : parts_) {
    if (auto *tc = std::get_if<ToolCallPart>(&part)) {
      result.push_back(tc);
    }
  }
  return result;
}

bool Message::has_tool_calls() const {
  for (const auto &part : parts_) {
    if (std::holds_alternative<ToolCallPart>(part)) return true;
  }
  return false;
}

const ToolResultPart *Message::tool_result() const {
  for (const auto &part : parts_) {
    if (auto *tr = std::get_if<ToolResultPart>(&part)) {
      return tr;
    }
  }
  return nullptr;
}

std::string Message::tool_call_id() const {
  auto *tr = tool_result();
  return tr ? tr->tool_call_id : std::string();
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["finish_reason"] = to_string(finish_reason_);
  j["is_synthetic"] = is_synthetic_;

  json parts_json = json::array();
  for (const auto &part : parts_) {
    json part_json;
    if (auto *text = std::get_if<TextPart>(&part)) {
      part_json["type"] = "text";
      part_json["text"] = text->text;
    } else if (auto *r = std::get_if<ReasoningPart>(&part)) {
      part_json["type"] = "reasoning";
      part_json["text"] = r->text;
    } else if (auto *tc = std::get_if<ToolCallPart>(&part)) {
      part_json["type"] = "tool_call";
      part_json["id"] = tc->id;
      part_json["name"] = tc->name;
      part_json["arguments"] = tc->arguments;
    } else if (auto *tr = std::get_if<ToolResultPart>(&part)) {
      part_json["type"] = "tool_result";
      part_json["tool_call_id"] = tr->tool_call_id;
      part_json["tool_name"] = tr->tool_name;
      part_json["output"] = tr->output;
      part_json["is_error"] = tr->is_error;
      part_json["metadata"] = tr->metadata;
    }
    parts_json.push_back(part_json);
  }
  j["parts"] = parts_json;

  j["usage"] = {{"input_tokens", usage_.input_tokens},
                {"output_tokens", usage_.output_tokens},
                {"cache_read_tokens", usage_.cache_read_tokens},
                {"cache_write_tokens", usage_.cache_write_tokens}};

  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.id_ = j.value("id", UUID::generate());
  msg.role_ = role_from_string(j.value("role", "user"));
  msg.finish_reason_ = finish_reason_from_string(j.value("finish_reason", "stop"));
  msg.is_synthetic_ = j.value("is_synthetic", false);

  if (j.contains("parts")) {
    for (const auto &part_json : j["parts"]) {
      std::string type = part_json.value("type", "");
      if (type == "text") {
        msg.parts_.push_back(TextPart{part_json.value("text", "")});
      } else if (type == "reasoning") {
        msg.parts_.push_back(ReasoningPart{part_json.value("text", "")});
      } else if (type == "tool_call") {
        msg.parts_.push_back(ToolCallPart{part_json.value("id", ""), part_json.value("name", ""), part_json.value("arguments", json::object())});
      } else if (type == "tool_result") {
        msg.parts_.push_back(ToolResultPart{part_json.value("tool_call_id", ""), part_json.value("tool_name", ""), part_json.value("output", ""),
                                            part_json.value("is_error", false), part_json.value("metadata", json::object())});
      }
    }
  }

  if (j.contains("usage")) {
    const auto &u = j["usage"];
    msg.usage_.input_tokens = u.value("input_tokens", 0);
    msg.usage_.output_tokens = u.value("output_tokens", 0);
    msg.usage_.cache_read_tokens = u.value("cache_read_tokens", 0);
    msg.usage_.cache_write_tokens = u.value("cache_write_tokens", 0);
  }

  return msg;
}

}  // namespace codeloop
