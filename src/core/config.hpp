#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace codeloop {

// Catalog entry for a delegated subagent
struct SubagentProfile {
  std::string name;
  std::string description;
  std::string instructions;

  // Tools the subagent may call, bound when the delegator is built
  std::vector<std::string> allowed_tool_names;

  int max_steps = 8;

  // Read-only unless the profile asks for more
  std::optional<SandboxMode> sandbox_mode;
};

// Tool backed by an external process speaking JSON over stdin/stdout
struct ExternalToolConfig {
  std::string name;
  std::string description;
  json parameters = json{{"type", "object"}, {"properties", json::object()}};
  bool mutating = true;
  int timeout_sec = 120;
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> workdir;
};

// Application configuration
struct Config {
  // Provider configs, keyed by provider name ("openai", "anthropic", "kimi", ...)
  std::map<std::string, ProviderConfig> providers;

  // Active provider and model
  std::string provider = "openai";
  std::string model = "gpt-4o";

  // Loop limits
  int max_steps = 20;
  int timeout_sec = 120;
  int max_retries = 3;
  int retry_backoff_ms = 500;
  int max_parallel_tools = 4;

  // Sampling
  std::optional<double> temperature;
  std::optional<int> max_tokens;

  // Sandbox
  std::filesystem::path workspace_root = std::filesystem::current_path();
  SandboxMode sandbox_mode = SandboxMode::WorkspaceWrite;
  ApprovalPolicy approval_policy = ApprovalPolicy::OnRequest;

  // Base system prompt text; empty selects the built-in one
  std::string system_prompt;

  // Subagent catalog; empty selects the default profiles
  std::vector<SubagentProfile> subagents;

  std::vector<ExternalToolConfig> external_tools;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file, throws ConfigError on malformed content
  static Config load(const std::filesystem::path &path);

  // Load default config from project/global config files
  static Config load_default();

  // File config overlaid with environment variables
  // Reads: OPENAI_API_KEY, OPENAI_BASE_URL
  //        ANTHROPIC_API_KEY/AUTH_TOKEN, ANTHROPIC_BASE_URL, ANTHROPIC_API_VERSION
  //        KIMI_API_KEY, KIMI_BASE_URL
  //        CODELOOP_PROVIDER, CODELOOP_MODEL
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path &path) const;

  std::optional<ProviderConfig> get_provider(const std::string &name) const;
};

// Default base URLs of the public endpoints
namespace default_urls {
inline constexpr const char *kOpenAI = "https://api.openai.com/v1";
inline constexpr const char *kAnthropic = "https://api.anthropic.com/v1";
inline constexpr const char *kKimi = "https://api.moonshot.cn/v1";
inline constexpr const char *kAnthropicVersion = "2023-06-01";
}  // namespace default_urls

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

// AGENTS.md / agents.md files from the filesystem root down to start_dir
std::vector<std::filesystem::path> find_agents_md(const std::filesystem::path &start_dir);
}  // namespace config_paths

}  // namespace codeloop
