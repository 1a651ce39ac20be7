#include "llm/openai.hpp"

#include <spdlog/spdlog.h>

#include "core/config.hpp"

namespace codeloop::llm {

json to_openai_tool(const Tool &tool) {
  auto schema = tool.to_json_schema();
  return {{"type", "function"},
          {"function", {{"name", schema["name"]}, {"description", schema["description"]}, {"parameters", schema["parameters"]}}}};
}

json parse_tool_arguments(const json &raw) {
  if (!raw.is_string()) {
    return raw.is_null() ? json::object() : raw;
  }
  auto text = raw.get<std::string>();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return json::object();
  }
  try {
    return json::parse(text);
  } catch (const json::parse_error &) {
    spdlog::warn("[OpenAI] tool call arguments are not valid JSON, passing through raw text");
    return raw;
  }
}

OpenAIProvider::OpenAIProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry,
                               std::optional<double> default_temperature)
    : HttpProvider(config, io_ctx, retry), base_url_(config.base_url), default_temperature_(default_temperature) {
  if (base_url_.empty()) {
    base_url_ = default_urls::kOpenAI;
  }
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string OpenAIProvider::endpoint() const {
  return base_url_ + "/chat/completions";
}

std::map<std::string, std::string> OpenAIProvider::request_headers() const {
  std::map<std::string, std::string> headers = {{"Authorization", "Bearer " + config_.api_key}};
  if (config_.organization && !config_.organization->empty()) {
    headers["OpenAI-Organization"] = *config_.organization;
  }
  return headers;
}

void OpenAIProvider::encode_assistant_extras(const Message &, json &) const {}

void OpenAIProvider::postprocess(Message &) const {}

json OpenAIProvider::encode_request(const LlmRequest &request) const {
  json body;
  body["model"] = request.model;

  if (request.max_tokens) {
    body["max_tokens"] = *request.max_tokens;
  }
  if (auto temperature = request.temperature ? request.temperature : default_temperature_) {
    body["temperature"] = *temperature;
  }

  json msgs = json::array();
  if (!request.system_prompt.empty()) {
    msgs.push_back({{"role", "system"}, {"content", request.system_prompt}});
  }

  for (const auto &msg : request.messages) {
    switch (msg.role()) {
      case Role::System:
        msgs.push_back({{"role", "system"}, {"content", msg.text()}});
        break;

      case Role::User:
        msgs.push_back({{"role", "user"}, {"content", msg.text()}});
        break;

      case Role::Assistant: {
        json m = {{"role", "assistant"}};
        auto text = msg.text();
        m["content"] = text.empty() && msg.has_tool_calls() ? json(nullptr) : json(text);

        auto calls = msg.tool_calls();
        if (!calls.empty()) {
          json tool_calls = json::array();
          for (const auto *tc : calls) {
            // Raw text the model sent stays as it was
            std::string arguments = tc->arguments.is_string() ? tc->arguments.get<std::string>() : tc->arguments.dump();
            tool_calls.push_back({{"id", tc->id}, {"type", "function"}, {"function", {{"name", tc->name}, {"arguments", arguments}}}});
          }
          m["tool_calls"] = tool_calls;
        }
        encode_assistant_extras(msg, m);
        msgs.push_back(m);
        break;
      }

      case Role::Tool:
        if (auto *tr = msg.tool_result()) {
          msgs.push_back({{"role", "tool"}, {"tool_call_id", tr->tool_call_id}, {"content", tr->output}});
        }
        break;
    }
  }
  body["messages"] = msgs;

  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto &tool : request.tools) {
      tools.push_back(to_openai_tool(*tool));
    }
    body["tools"] = tools;
    body["tool_choice"] = "auto";
  }

  return body;
}

LlmResponse OpenAIProvider::decode_response(const json &body) const {
  if (body.contains("error") && !body["error"].is_null()) {
    auto err = body["error"];
    std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
    throw ProviderError(ProviderErrorKind::InvalidResponse, "provider error: " + message);
  }
  if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
    throw ProviderError(ProviderErrorKind::InvalidResponse, "response has no choices");
  }

  LlmResponse result;
  const auto &choice = body["choices"][0];
  const auto &message = choice.at("message");

  Message msg(Role::Assistant, "");

  if (message.contains("reasoning_content") && message["reasoning_content"].is_string()) {
    msg.add_reasoning(message["reasoning_content"].get<std::string>());
  }

  if (message.contains("content") && message["content"].is_string()) {
    auto text = message["content"].get<std::string>();
    if (!text.empty()) {
      msg.add_text(text);
    }
  }

  if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
    for (const auto &tc : message["tool_calls"]) {
      std::string id = tc.contains("id") && tc["id"].is_string() ? tc["id"].get<std::string>() : "";
      if (id.empty()) {
        id = "call_" + UUID::short_id();
      }
      const auto &function = tc.at("function");
      std::string tool_name = function.value("name", "");
      json arguments = parse_tool_arguments(function.contains("arguments") ? function["arguments"] : json::object());
      msg.add_tool_call(id, tool_name, arguments);
    }
  }

  postprocess(msg);

  std::string finish_reason = choice.contains("finish_reason") && choice["finish_reason"].is_string() ? choice["finish_reason"].get<std::string>() : "stop";
  result.finish_reason = msg.has_tool_calls() ? FinishReason::ToolCalls : finish_reason_from_string(finish_reason);

  if (body.contains("usage") && body["usage"].is_object()) {
    const auto &usage = body["usage"];
    result.usage.input_tokens = usage.value("prompt_tokens", 0);
    result.usage.output_tokens = usage.value("completion_tokens", 0);
    if (usage.contains("prompt_tokens_details") && usage["prompt_tokens_details"].is_object()) {
      result.usage.cache_read_tokens = usage["prompt_tokens_details"].value("cached_tokens", 0);
    }
  }

  msg.set_finish_reason(result.finish_reason);
  msg.set_usage(result.usage);
  result.message = std::move(msg);
  return result;
}

}  // namespace codeloop::llm
