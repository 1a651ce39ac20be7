#pragma once

#include "llm/provider.hpp"

namespace codeloop::llm {

// OpenAI chat completions provider.
// Tool results travel as role="tool" messages; tool call arguments are JSON
// encoded strings on the wire.
class OpenAIProvider : public HttpProvider {
 public:
  OpenAIProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry = {},
                 std::optional<double> default_temperature = 0.0);

  std::string name() const override {
    return config_.name.empty() ? "openai" : config_.name;
  }

  json encode_request(const LlmRequest &request) const override;

  LlmResponse decode_response(const json &body) const override;

 protected:
  std::string endpoint() const override;
  std::map<std::string, std::string> request_headers() const override;

  // Hook for compatible endpoints that echo extra assistant fields
  virtual void encode_assistant_extras(const Message &message, json &encoded) const;

  // Hook applied to the decoded assistant message
  virtual void postprocess(Message &message) const;

  std::string base_url_;
  std::optional<double> default_temperature_;
};

// Canonical tool schema -> {"type":"function","function":{...}}
json to_openai_tool(const Tool &tool);

// Wire arguments (usually a JSON string) -> canonical arguments.
// Unparseable text is kept as a string so schema validation rejects it.
json parse_tool_arguments(const json &raw);

}  // namespace codeloop::llm
