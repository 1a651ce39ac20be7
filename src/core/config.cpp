#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "errors.hpp"

namespace codeloop {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env(const char *name) {
  const char *value = std::getenv(name);
  if (!value || !*value) return std::nullopt;
  return std::string(value);
}

SubagentProfile profile_from_json(const json &j) {
  SubagentProfile profile;
  profile.name = j.at("name").get<std::string>();
  profile.description = j.value("description", "");
  profile.instructions = j.value("instructions", "");
  profile.max_steps = std::max(1, j.value("max_steps", 8));
  if (j.contains("allowed_tools")) {
    for (const auto &tool : j["allowed_tools"]) {
      profile.allowed_tool_names.push_back(tool.get<std::string>());
    }
  }
  if (j.contains("sandbox_mode")) {
    profile.sandbox_mode = sandbox_mode_from_string(j["sandbox_mode"].get<std::string>());
  }
  return profile;
}

ExternalToolConfig external_tool_from_json(const json &j) {
  ExternalToolConfig tool;
  tool.name = j.at("name").get<std::string>();
  tool.description = j.value("description", "");
  if (j.contains("parameters")) {
    tool.parameters = j["parameters"];
  }
  tool.mutating = j.value("mutating", true);
  tool.timeout_sec = std::clamp(j.value("timeout_sec", 120), 1, 1800);
  for (const auto &arg : j.at("argv")) {
    tool.argv.push_back(arg.get<std::string>());
  }
  if (tool.argv.empty()) {
    throw ConfigError("external tool '" + tool.name + "' has an empty argv");
  }
  if (j.contains("workdir")) {
    tool.workdir = j["workdir"].get<std::string>();
  }
  return tool;
}

}  // namespace

Config Config::load(const fs::path &path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("providers")) {
      for (auto &[name, provider_json] : j["providers"].items()) {
        ProviderConfig provider;
        provider.name = name;
        provider.api_key = provider_json.value("api_key", "");
        provider.base_url = provider_json.value("base_url", "");
        provider.api_version = provider_json.value("api_version", "");
        if (provider_json.contains("organization")) {
          provider.organization = provider_json["organization"];
        }
        if (provider_json.contains("headers")) {
          for (auto &[k, v] : provider_json["headers"].items()) {
            provider.headers[k] = v;
          }
        }
        config.providers[name] = provider;
      }
    }

    config.provider = j.value("provider", config.provider);
    config.model = j.value("model", config.model);

    config.max_steps = std::max(1, j.value("max_steps", config.max_steps));
    config.timeout_sec = std::max(1, j.value("timeout_sec", config.timeout_sec));
    config.max_retries = std::max(0, j.value("max_retries", config.max_retries));
    config.retry_backoff_ms = std::max(0, j.value("retry_backoff_ms", config.retry_backoff_ms));
    config.max_parallel_tools = std::max(1, j.value("max_parallel_tools", config.max_parallel_tools));

    if (j.contains("temperature")) {
      config.temperature = j["temperature"].get<double>();
    }
    if (j.contains("max_tokens")) {
      config.max_tokens = j["max_tokens"].get<int>();
    }

    if (j.contains("workspace_root")) {
      config.workspace_root = j["workspace_root"].get<std::string>();
    }
    if (j.contains("sandbox_mode")) {
      config.sandbox_mode = sandbox_mode_from_string(j["sandbox_mode"].get<std::string>());
    }
    if (j.contains("approval_policy")) {
      config.approval_policy = approval_policy_from_string(j["approval_policy"].get<std::string>());
    }
    config.system_prompt = j.value("system_prompt", "");

    if (j.contains("subagents")) {
      for (const auto &profile_json : j["subagents"]) {
        config.subagents.push_back(profile_from_json(profile_json));
      }
    }

    if (j.contains("external_tools")) {
      for (const auto &tool_json : j["external_tools"]) {
        config.external_tools.push_back(external_tool_from_json(tool_json));
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const json::exception &e) {
    throw ConfigError("invalid config " + path.string() + ": " + e.what());
  }

  return config;
}

Config Config::load_default() {
  // Project config wins over the global one
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  auto overlay = [&config](const std::string &name, const std::optional<std::string> &key, const std::optional<std::string> &base_url,
                           const char *default_url) {
    auto &provider = config.providers[name];
    provider.name = name;
    if (key) provider.api_key = *key;
    if (base_url) {
      provider.base_url = *base_url;
    } else if (provider.base_url.empty()) {
      provider.base_url = default_url;
    }
  };

  auto openai_key = env("OPENAI_API_KEY");
  if (openai_key || config.providers.count("openai")) {
    overlay("openai", openai_key, env("OPENAI_BASE_URL"), default_urls::kOpenAI);
  }

  auto anthropic_key = env("ANTHROPIC_API_KEY");
  if (!anthropic_key) {
    anthropic_key = env("ANTHROPIC_AUTH_TOKEN");
  }
  if (anthropic_key || config.providers.count("anthropic")) {
    overlay("anthropic", anthropic_key, env("ANTHROPIC_BASE_URL"), default_urls::kAnthropic);
    auto &provider = config.providers["anthropic"];
    if (auto version = env("ANTHROPIC_API_VERSION")) {
      provider.api_version = *version;
    } else if (provider.api_version.empty()) {
      provider.api_version = default_urls::kAnthropicVersion;
    }
  }

  auto kimi_key = env("KIMI_API_KEY");
  if (kimi_key || config.providers.count("kimi")) {
    overlay("kimi", kimi_key, env("KIMI_BASE_URL"), default_urls::kKimi);
  }

  if (auto provider = env("CODELOOP_PROVIDER")) {
    config.provider = *provider;
  }
  if (auto model = env("CODELOOP_MODEL")) {
    config.model = *model;
  }

  return config;
}

void Config::save(const fs::path &path) const {
  json j;

  json providers_json = json::object();
  for (const auto &[name, provider] : providers) {
    json p;
    p["api_key"] = provider.api_key;
    p["base_url"] = provider.base_url;
    if (!provider.api_version.empty()) {
      p["api_version"] = provider.api_version;
    }
    if (provider.organization) {
      p["organization"] = *provider.organization;
    }
    if (!provider.headers.empty()) {
      p["headers"] = provider.headers;
    }
    providers_json[name] = p;
  }
  j["providers"] = providers_json;

  j["provider"] = provider;
  j["model"] = model;
  j["max_steps"] = max_steps;
  j["timeout_sec"] = timeout_sec;
  j["max_retries"] = max_retries;
  j["retry_backoff_ms"] = retry_backoff_ms;
  j["max_parallel_tools"] = max_parallel_tools;
  if (temperature) j["temperature"] = *temperature;
  if (max_tokens) j["max_tokens"] = *max_tokens;

  j["workspace_root"] = workspace_root.string();
  j["sandbox_mode"] = to_string(sandbox_mode);
  j["approval_policy"] = to_string(approval_policy);
  if (!system_prompt.empty()) {
    j["system_prompt"] = system_prompt;
  }

  json subagents_json = json::array();
  for (const auto &profile : subagents) {
    json s;
    s["name"] = profile.name;
    s["description"] = profile.description;
    s["instructions"] = profile.instructions;
    s["allowed_tools"] = profile.allowed_tool_names;
    s["max_steps"] = profile.max_steps;
    if (profile.sandbox_mode) {
      s["sandbox_mode"] = to_string(*profile.sandbox_mode);
    }
    subagents_json.push_back(s);
  }
  j["subagents"] = subagents_json;

  json tools_json = json::array();
  for (const auto &tool : external_tools) {
    json t;
    t["name"] = tool.name;
    t["description"] = tool.description;
    t["parameters"] = tool.parameters;
    t["mutating"] = tool.mutating;
    t["timeout_sec"] = tool.timeout_sec;
    t["argv"] = tool.argv;
    if (tool.workdir) {
      t["workdir"] = tool.workdir->string();
    }
    tools_json.push_back(t);
  }
  j["external_tools"] = tools_json;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  } else {
    spdlog::error("[Config] Cannot write {}", path.string());
  }
}

std::optional<ProviderConfig> Config::get_provider(const std::string &name) const {
  auto it = providers.find(name);
  if (it != providers.end()) {
    return it->second;
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "codeloop";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".codeloop" / "config.json";
}

std::vector<fs::path> find_agents_md(const fs::path &start_dir) {
  std::vector<fs::path> result;

  std::error_code ec;
  fs::path current = fs::weakly_canonical(fs::absolute(start_dir), ec);
  if (ec) current = fs::absolute(start_dir);

  while (true) {
    std::vector<fs::path> found;
    for (const char *name : {"AGENTS.md", "agents.md"}) {
      auto candidate = current / name;
      if (fs::is_regular_file(candidate, ec)) {
        // Case-insensitive filesystems report the same file twice
        bool duplicate = std::any_of(found.begin(), found.end(), [&](const fs::path &p) { return fs::equivalent(p, candidate, ec); });
        if (!duplicate) found.push_back(candidate);
      }
    }
    // Pushed in reverse so the final reverse keeps AGENTS.md before agents.md
    for (auto it = found.rbegin(); it != found.rend(); ++it) {
      result.push_back(*it);
    }

    auto parent = current.parent_path();
    if (parent == current) break;  // Filesystem root
    current = parent;
  }

  // Parent (more general) instructions come first
  std::reverse(result.begin(), result.end());
  return result;
}

}  // namespace config_paths

}  // namespace codeloop
