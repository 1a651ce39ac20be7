#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "net/http_client.hpp"
#include "tool/tool.hpp"

namespace codeloop::llm {

// LLM request
struct LlmRequest {
  std::string model;
  std::vector<Message> messages;
  std::string system_prompt;

  // Tool definitions
  std::vector<std::shared_ptr<Tool>> tools;

  // Generation parameters
  std::optional<double> temperature;
  std::optional<int> max_tokens;
};

// LLM response
struct LlmResponse {
  Message message;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
};

// Transport retry settings
struct RetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  std::chrono::seconds timeout{120};

  // backoff * 2^attempt, capped at max_backoff
  std::chrono::milliseconds delay(int attempt) const;
};

// Abstract LLM provider interface
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // Next assistant message for the given history.
  // Throws ProviderError, or CancelledError once abort_signal is set; setting
  // the flag cancels only the request made for this call.
  virtual LlmResponse send(const LlmRequest &request, const std::shared_ptr<std::atomic<bool>> &abort_signal) = 0;
};

// Map a failed HTTP exchange to a ProviderError kind
ProviderError classify_http_error(int status_code, const std::string &body);

// JSON-over-HTTPS provider with retry, classification and cancellation.
// Variants supply the wire translation and the endpoint.
class HttpProvider : public Provider {
 public:
  HttpProvider(ProviderConfig config, asio::io_context &io_ctx, RetryPolicy retry);

  LlmResponse send(const LlmRequest &request, const std::shared_ptr<std::atomic<bool>> &abort_signal) override;

  // Canonical request -> provider body
  virtual json encode_request(const LlmRequest &request) const = 0;

  // Provider body -> canonical assistant message; throws ProviderError on bad shapes
  virtual LlmResponse decode_response(const json &body) const = 0;

  const ProviderConfig &config() const {
    return config_;
  }

 protected:
  virtual std::string endpoint() const = 0;
  virtual std::map<std::string, std::string> request_headers() const = 0;

  ProviderConfig config_;

 private:
  LlmResponse attempt(const std::string &body, const std::shared_ptr<std::atomic<bool>> &abort_signal);

  net::HttpClient http_client_;
  RetryPolicy retry_;
};

// Provider factory
class ProviderFactory {
 public:
  static ProviderFactory &instance();

  // Throws ConfigError for unknown names or missing credentials
  std::shared_ptr<Provider> create(const std::string &name, const ProviderConfig &config, asio::io_context &io_ctx,
                                   const RetryPolicy &retry = {});

  // Register custom provider factory
  using FactoryFunc = std::function<std::shared_ptr<Provider>(const ProviderConfig &, asio::io_context &, const RetryPolicy &)>;
  void register_provider(const std::string &name, FactoryFunc factory);

  std::vector<std::string> names() const;

 private:
  ProviderFactory();

  mutable std::mutex mutex_;
  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace codeloop::llm
