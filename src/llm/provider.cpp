#include "llm/provider.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <thread>

#include "core/config.hpp"
#include "llm/anthropic.hpp"
#include "llm/compatible.hpp"
#include "llm/openai.hpp"

namespace codeloop::llm {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

bool is_aborted(const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  return abort_signal && abort_signal->load();
}

// Sleep in slices so cancellation stays responsive
void sleep_for(std::chrono::milliseconds delay, const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (std::chrono::steady_clock::now() < deadline) {
    if (is_aborted(abort_signal)) {
      throw CancelledError();
    }
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
        POLL_INTERVAL, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())));
  }
}

std::string error_message(const std::string &body) {
  try {
    auto j = json::parse(body);
    if (j.contains("error")) {
      const auto &err = j["error"];
      if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
      }
      if (err.is_string()) {
        return err.get<std::string>();
      }
    }
  } catch (const json::parse_error &) {
  }
  return body.size() > 500 ? body.substr(0, 500) + "..." : body;
}

}  // namespace

std::chrono::milliseconds RetryPolicy::delay(int attempt) const {
  auto ms = backoff.count();
  for (int i = 0; i < attempt && ms < max_backoff.count(); ++i) {
    ms *= 2;
  }
  return std::chrono::milliseconds(std::min<int64_t>(ms, max_backoff.count()));
}

ProviderError classify_http_error(int status_code, const std::string &body) {
  std::string message = "HTTP " + std::to_string(status_code);
  if (!body.empty()) {
    message += ": " + error_message(body);
  }

  if (status_code == 401 || status_code == 403) {
    return ProviderError(ProviderErrorKind::Auth, message, status_code);
  }
  if (status_code == 429) {
    // Exhausted quota needs operator action, waiting will not help
    for (const char *marker : {"insufficient_quota", "quota_exceeded", "billing"}) {
      if (body.find(marker) != std::string::npos) {
        return ProviderError(ProviderErrorKind::Auth, message, status_code);
      }
    }
    return ProviderError(ProviderErrorKind::RateLimit, message, status_code);
  }
  if (status_code == 0 || status_code >= 500) {
    return ProviderError(ProviderErrorKind::Network, message, status_code);
  }
  return ProviderError(ProviderErrorKind::InvalidResponse, message, status_code);
}

HttpProvider::HttpProvider(ProviderConfig config, asio::io_context &io_ctx, RetryPolicy retry)
    : config_(std::move(config)), http_client_(io_ctx), retry_(retry) {}

LlmResponse HttpProvider::send(const LlmRequest &request, const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  auto body = encode_request(request).dump(-1, ' ', false, json::error_handler_t::replace);
  spdlog::debug("[{}] POST {} ({} bytes, {} messages)", name(), endpoint(), body.size(), request.messages.size());

  for (int attempt = 0;; ++attempt) {
    if (is_aborted(abort_signal)) {
      throw CancelledError();
    }
    try {
      return this->attempt(body, abort_signal);
    } catch (const ProviderError &e) {
      if (!e.retryable() || attempt >= retry_.max_retries) {
        spdlog::error("[{}] {} ({})", name(), e.what(), to_string(e.kind()));
        throw;
      }
      auto delay = retry_.delay(attempt);
      spdlog::warn("[{}] {} ({}), retry {}/{} in {}ms", name(), e.what(), to_string(e.kind()), attempt + 1, retry_.max_retries, delay.count());
      sleep_for(delay, abort_signal);
    }
  }
}

LlmResponse HttpProvider::attempt(const std::string &body, const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  net::HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.timeout = retry_.timeout;
  options.headers = request_headers();
  options.headers["Content-Type"] = "application/json";
  for (const auto &[key, value] : config_.headers) {
    options.headers[key] = value;
  }

  net::RequestId request_id = 0;
  auto future = http_client_.request(endpoint(), options, &request_id);
  while (future.wait_for(POLL_INTERVAL) != std::future_status::ready) {
    if (is_aborted(abort_signal)) {
      http_client_.cancel(request_id);
      future.wait_for(std::chrono::seconds(5));
      throw CancelledError();
    }
  }

  auto response = future.get();
  if (response.cancelled) {
    throw CancelledError();
  }
  if (response.timed_out) {
    throw ProviderError(ProviderErrorKind::Network, "request timed out after " + std::to_string(retry_.timeout.count()) + "s");
  }
  if (!response.error.empty()) {
    throw ProviderError(ProviderErrorKind::Network, "network error: " + response.error);
  }
  if (!response.ok()) {
    throw classify_http_error(response.status_code, response.body);
  }

  json j;
  try {
    j = json::parse(response.body);
  } catch (const json::parse_error &e) {
    throw ProviderError(ProviderErrorKind::InvalidResponse, std::string("malformed response body: ") + e.what(), response.status_code);
  }

  try {
    return decode_response(j);
  } catch (const json::exception &e) {
    throw ProviderError(ProviderErrorKind::InvalidResponse, std::string("unexpected response shape: ") + e.what(), response.status_code);
  }
}

ProviderFactory &ProviderFactory::instance() {
  static ProviderFactory instance;
  return instance;
}

ProviderFactory::ProviderFactory() {
  register_provider("openai", [](const ProviderConfig &cfg, asio::io_context &ctx, const RetryPolicy &retry) {
    return std::make_shared<OpenAIProvider>(cfg, ctx, retry);
  });
  register_provider("anthropic", [](const ProviderConfig &cfg, asio::io_context &ctx, const RetryPolicy &retry) {
    return std::make_shared<AnthropicProvider>(cfg, ctx, retry);
  });
  register_provider("compatible", [](const ProviderConfig &cfg, asio::io_context &ctx, const RetryPolicy &retry) {
    return std::make_shared<CompatibleProvider>(cfg, ctx, retry);
  });
  register_provider("kimi", [](const ProviderConfig &cfg, asio::io_context &ctx, const RetryPolicy &retry) {
    auto kimi = cfg;
    if (kimi.base_url.empty()) kimi.base_url = default_urls::kKimi;
    return std::make_shared<CompatibleProvider>(kimi, ctx, retry, 1.0);
  });
}

std::shared_ptr<Provider> ProviderFactory::create(const std::string &name, const ProviderConfig &config, asio::io_context &io_ctx,
                                                  const RetryPolicy &retry) {
  FactoryFunc factory;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      throw ConfigError("unsupported provider: " + name);
    }
    factory = it->second;
  }

  if (config.api_key.empty()) {
    std::string var = name;
    std::transform(var.begin(), var.end(), var.begin(), [](unsigned char c) { return std::toupper(c); });
    throw ConfigError(var + "_API_KEY is required for provider=" + name);
  }

  spdlog::info("[ProviderFactory] creating {} ({})", name, config.base_url.empty() ? "default endpoint" : config.base_url);
  return factory(config, io_ctx, retry);
}

void ProviderFactory::register_provider(const std::string &name, FactoryFunc factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  factories_[name] = std::move(factory);
}

std::vector<std::string> ProviderFactory::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  for (const auto &[name, _] : factories_) {
    result.push_back(name);
  }
  return result;
}

}  // namespace codeloop::llm
