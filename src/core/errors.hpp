#pragma once

#include <stdexcept>
#include <string>

namespace codeloop {

// Failure classes of a model provider call
enum class ProviderErrorKind { Auth, RateLimit, Network, InvalidResponse };

std::string to_string(ProviderErrorKind kind);

// Raised by a provider when a model call fails.
// Network and RateLimit are transient and may be retried; Auth and
// InvalidResponse are terminal for the session.
class ProviderError : public std::runtime_error {
 public:
  ProviderError(ProviderErrorKind kind, const std::string &message, int status_code = 0)
      : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

  ProviderErrorKind kind() const {
    return kind_;
  }

  int status_code() const {
    return status_code_;
  }

  bool retryable() const {
    return kind_ == ProviderErrorKind::Network || kind_ == ProviderErrorKind::RateLimit;
  }

 private:
  ProviderErrorKind kind_;
  int status_code_;
};

// Invalid configuration detected at startup or binding time
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

// Session cancellation observed while waiting on the network
class CancelledError : public std::runtime_error {
 public:
  CancelledError() : std::runtime_error("cancelled") {}
};

// Failures recovered by the sandbox gate into an error ToolResult
enum class ToolErrorKind { UnknownTool, SchemaInvalid, SandboxDenied, ApprovalDenied, Timeout, HandlerFailure };

std::string to_string(ToolErrorKind kind);

}  // namespace codeloop
