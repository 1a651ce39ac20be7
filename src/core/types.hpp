#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace codeloop {

using json = nlohmann::json;

// Type aliases
using SessionId = std::string;
using MessageId = std::string;
using ToolCallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_write_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_write_tokens += other.cache_write_tokens;
    return *this;
  }
};

// Finish reason reported by the model
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Needs tool execution
  Length,     // Token limit reached
  Error,      // Error occurred
  Cancelled   // User cancelled
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// Permission tier for mutating tools
enum class SandboxMode {
  ReadOnly,         // Mutating tools refused
  WorkspaceWrite,   // Mutating tools confined to the workspace root
  DangerFullAccess  // No path restriction
};

std::string to_string(SandboxMode mode);

// Throws ConfigError on unknown names
SandboxMode sandbox_mode_from_string(const std::string &str);

// When a human confirmation is required before a mutating tool runs
enum class ApprovalPolicy {
  OnRequest,  // First use of each tool, or when the tool asks again
  Always,     // Every mutating call
  Never       // No prompting
};

std::string to_string(ApprovalPolicy policy);

// Throws ConfigError on unknown names
ApprovalPolicy approval_policy_from_string(const std::string &str);

// Provider configuration
struct ProviderConfig {
  std::string name;
  std::string api_key;
  std::string base_url;
  std::optional<std::string> organization;
  std::map<std::string, std::string> headers;

  // Anthropic only
  std::string api_version;
};

// Replace invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string &input);

}  // namespace codeloop
