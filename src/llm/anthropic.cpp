#include "llm/anthropic.hpp"

#include <spdlog/spdlog.h>

#include "core/config.hpp"

namespace codeloop::llm {

namespace {

// tool_use input must be an object
json to_tool_input(const json &arguments) {
  if (arguments.is_object()) {
    return arguments;
  }
  if (arguments.is_string()) {
    return {{"_raw_arguments", arguments.get<std::string>()}};
  }
  return {{"value", arguments}};
}

// Append blocks to the last turn when it has the same role
void push_turn(json &msgs, const std::string &role, json blocks) {
  if (!msgs.empty() && msgs.back()["role"] == role) {
    for (auto &block : blocks) {
      msgs.back()["content"].push_back(std::move(block));
    }
    return;
  }
  msgs.push_back({{"role", role}, {"content", std::move(blocks)}});
}

}  // namespace

AnthropicProvider::AnthropicProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry)
    : HttpProvider(config, io_ctx, retry), base_url_(config.base_url), api_version_(config.api_version) {
  if (base_url_.empty()) {
    base_url_ = default_urls::kAnthropic;
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  if (api_version_.empty()) {
    api_version_ = default_urls::kAnthropicVersion;
  }
}

std::string AnthropicProvider::endpoint() const {
  return base_url_ + "/messages";
}

std::map<std::string, std::string> AnthropicProvider::request_headers() const {
  return {{"x-api-key", config_.api_key}, {"anthropic-version", api_version_}};
}

json AnthropicProvider::encode_request(const LlmRequest &request) const {
  json body;
  body["model"] = request.model;
  body["max_tokens"] = request.max_tokens.value_or(DEFAULT_MAX_TOKENS);
  body["temperature"] = request.temperature.value_or(0.0);

  std::string system = request.system_prompt;
  json msgs = json::array();

  for (const auto &msg : request.messages) {
    switch (msg.role()) {
      case Role::System: {
        auto text = msg.text();
        if (!text.empty()) {
          system += (system.empty() ? "" : "\n\n") + text;
        }
        break;
      }

      case Role::User:
        push_turn(msgs, "user", json::array({{{"type", "text"}, {"text", msg.text()}}}));
        break;

      case Role::Assistant: {
        json blocks = json::array();
        for (const auto &part : msg.parts()) {
          if (auto *text = std::get_if<TextPart>(&part)) {
            if (!text->text.empty()) {
              blocks.push_back({{"type", "text"}, {"text", text->text}});
            }
          } else if (auto *tc = std::get_if<ToolCallPart>(&part)) {
            blocks.push_back({{"type", "tool_use"}, {"id", tc->id}, {"name", tc->name}, {"input", to_tool_input(tc->arguments)}});
          }
        }
        if (blocks.empty()) {
          blocks.push_back({{"type", "text"}, {"text", ""}});
        }
        push_turn(msgs, "assistant", std::move(blocks));
        break;
      }

      case Role::Tool:
        if (auto *tr = msg.tool_result()) {
          json block = {{"type", "tool_result"}, {"tool_use_id", tr->tool_call_id}, {"content", tr->output}};
          if (tr->is_error) {
            block["is_error"] = true;
          }
          push_turn(msgs, "user", json::array({block}));
        }
        break;
    }
  }

  if (!system.empty()) {
    body["system"] = system;
  }
  body["messages"] = msgs;

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto &tool : request.tools) {
      auto schema = tool->to_json_schema();
      tools.push_back({{"name", schema["name"]}, {"description", schema["description"]}, {"input_schema", schema["parameters"]}});
    }
    body["tools"] = tools;
  }

  return body;
}

LlmResponse AnthropicProvider::decode_response(const json &body) const {
  if (body.value("type", "") == "error") {
    std::string message = body.contains("error") && body["error"].is_object() ? body["error"].value("message", "unknown error") : body.dump();
    throw ProviderError(ProviderErrorKind::InvalidResponse, "provider error: " + message);
  }
  if (!body.contains("content") || !body["content"].is_array()) {
    throw ProviderError(ProviderErrorKind::InvalidResponse, "response has no content blocks");
  }

  LlmResponse result;
  Message msg(Role::Assistant, "");

  for (const auto &block : body["content"]) {
    std::string type = block.value("type", "");
    if (type == "text") {
      auto text = block.value("text", "");
      if (!text.empty()) {
        msg.add_text(text);
      }
    } else if (type == "thinking") {
      msg.add_reasoning(block.value("thinking", ""));
    } else if (type == "tool_use") {
      std::string id = block.value("id", "");
      if (id.empty()) {
        id = "toolu_" + UUID::short_id();
      }
      msg.add_tool_call(id, block.value("name", ""), block.contains("input") ? block["input"] : json::object());
    } else if (type != "redacted_thinking") {
      spdlog::debug("[Anthropic] skipping content block of type {}", type);
    }
  }

  std::string stop_reason = body.contains("stop_reason") && body["stop_reason"].is_string() ? body["stop_reason"].get<std::string>() : "end_turn";
  result.finish_reason = msg.has_tool_calls() ? FinishReason::ToolCalls : finish_reason_from_string(stop_reason);

  if (body.contains("usage") && body["usage"].is_object()) {
    const auto &usage = body["usage"];
    result.usage.input_tokens = usage.value("input_tokens", 0);
    result.usage.output_tokens = usage.value("output_tokens", 0);
    result.usage.cache_read_tokens = usage.value("cache_read_input_tokens", 0);
    result.usage.cache_write_tokens = usage.value("cache_creation_input_tokens", 0);
  }

  msg.set_finish_reason(result.finish_reason);
  msg.set_usage(result.usage);
  result.message = std::move(msg);
  return result;
}

}  // namespace codeloop::llm
