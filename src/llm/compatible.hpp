#pragma once

#include "llm/openai.hpp"

namespace codeloop::llm {

// OpenAI-compatible endpoint (Kimi, local gateways).
// Reasoning models there return reasoning_content, or inline <think> blocks,
// and some expect reasoning_content echoed back on assistant turns.
class CompatibleProvider : public OpenAIProvider {
 public:
  CompatibleProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry = {},
                     std::optional<double> default_temperature = 0.0);

  std::string name() const override {
    return config_.name.empty() ? "compatible" : config_.name;
  }

 protected:
  void encode_assistant_extras(const Message &message, json &encoded) const override;
  void postprocess(Message &message) const override;
};

// Split "<think>...</think>" out of text: returns {answer, reasoning}
std::pair<std::string, std::string> split_think_blocks(const std::string &text);

}  // namespace codeloop::llm
