#pragma once

#include "llm/provider.hpp"

namespace codeloop::llm {

// Anthropic Messages API provider.
// The system prompt is a top-level field; tool results are tool_result
// blocks inside a user turn, consecutive results merged into one turn.
class AnthropicProvider : public HttpProvider {
 public:
  AnthropicProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry = {});

  std::string name() const override {
    return "anthropic";
  }

  json encode_request(const LlmRequest &request) const override;

  LlmResponse decode_response(const json &body) const override;

  static constexpr int DEFAULT_MAX_TOKENS = 4096;

 protected:
  std::string endpoint() const override;
  std::map<std::string, std::string> request_headers() const override;

 private:
  std::string base_url_;
  std::string api_version_;
};

}  // namespace codeloop::llm
