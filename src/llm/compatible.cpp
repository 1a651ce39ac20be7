#include "llm/compatible.hpp"

namespace codeloop::llm {

namespace {

constexpr const char *kThinkOpen = "<think>";
constexpr const char *kThinkClose = "</think>";

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

}  // namespace

std::pair<std::string, std::string> split_think_blocks(const std::string &text) {
  std::string answer;
  std::string reasoning;

  size_t pos = 0;
  while (pos < text.size()) {
    auto open = text.find(kThinkOpen, pos);
    if (open == std::string::npos) {
      answer += text.substr(pos);
      break;
    }
    answer += text.substr(pos, open - pos);

    auto body_start = open + std::char_traits<char>::length(kThinkOpen);
    auto close = text.find(kThinkClose, body_start);
    // Unterminated block: the rest is reasoning
    auto body_end = close == std::string::npos ? text.size() : close;
    if (!reasoning.empty()) reasoning += "\n";
    reasoning += trim(text.substr(body_start, body_end - body_start));

    pos = close == std::string::npos ? text.size() : close + std::char_traits<char>::length(kThinkClose);
  }

  return {trim(answer), reasoning};
}

CompatibleProvider::CompatibleProvider(const ProviderConfig &config, asio::io_context &io_ctx, const RetryPolicy &retry,
                                       std::optional<double> default_temperature)
    : OpenAIProvider(config, io_ctx, retry, default_temperature) {}

void CompatibleProvider::encode_assistant_extras(const Message &message, json &encoded) const {
  if (auto reasoning = message.reasoning()) {
    encoded["reasoning_content"] = *reasoning;
  }
}

void CompatibleProvider::postprocess(Message &message) const {
  auto text = message.text();
  if (text.find(kThinkOpen) == std::string::npos) {
    return;
  }

  auto [answer, reasoning] = split_think_blocks(text);

  // Rebuild with reasoning first, then answer, then tool calls
  Message rebuilt(Role::Assistant, "");
  if (auto existing = message.reasoning()) {
    rebuilt.add_reasoning(*existing);
  }
  rebuilt.add_reasoning(reasoning);
  if (!answer.empty()) {
    rebuilt.add_text(answer);
  }
  for (const auto *tc : message.tool_calls()) {
    rebuilt.add_tool_call(tc->id, tc->name, tc->arguments);
  }
  message = std::move(rebuilt);
}

}  // namespace codeloop::llm
