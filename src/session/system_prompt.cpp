#include "session/system_prompt.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>

#include "core/config.hpp"

namespace codeloop {

namespace {

std::string utc_now() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string read_trimmed(const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) return "";
  std::ostringstream ss;
  ss << ifs.rdbuf();
  auto content = ss.str();
  auto begin = content.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = content.find_last_not_of(" \t\r\n");
  return content.substr(begin, end - begin + 1);
}

}  // namespace

const std::string &default_base_prompt() {
  static const std::string prompt =
      "You are codeloop, a terminal coding agent.\n"
      "You work with the user on coding and research tasks inside a sandboxed workspace.\n\n"
      "# Core Principles\n"
      "- Be concise and direct.\n"
      "- Answer in the user's language unless asked otherwise.\n"
      "- Check facts with tools instead of guessing file paths, names or APIs.\n"
      "- Keep changes minimal and focused on the requested goal.\n\n"
      "# Tool Usage\n"
      "Prefer the dedicated tools over exec_command:\n"
      "- list_files to explore directories\n"
      "- read_file to read files\n"
      "- grep_files to search file contents\n"
      "- replace_in_file to edit existing files, after reading them\n"
      "- write_file to create files\n\n"
      "Use exec_command for tests, builds, git and other tasks without a dedicated tool.\n"
      "Independent reads and searches can be issued as parallel tool calls in one response.\n"
      "For tasks with three or more steps, keep the plan current with update_plan.\n"
      "Use delegate_task to hand focused read-only investigations to a subagent.\n"
      "Mutating actions are subject to the runtime sandbox and approval policy; a refusal is final for that call.\n\n"
      "# Git Safety\n"
      "- Never force-push or rewrite published history without explicit approval.\n"
      "- Never commit secrets.\n\n"
      "# Reminders\n"
      "- When something fails, find the root cause instead of retrying blindly.\n"
      "- Confirm with the user before irreversible changes if unsure.\n";
  return prompt;
}

std::string build_system_prompt(const std::filesystem::path &workspace_root, const std::string &base_prompt) {
  std::string agents_text;
  for (const auto &file : config_paths::find_agents_md(workspace_root)) {
    auto content = read_trimmed(file);
    if (!agents_text.empty()) agents_text += "\n\n";
    agents_text += "## " + file.string() + "\n" + content;
    spdlog::debug("[SystemPrompt] loaded instructions from {}", file.string());
  }
  if (agents_text.empty()) {
    agents_text = "(none)";
  }

  std::string prompt = base_prompt.empty() ? default_base_prompt() : base_prompt;
  if (!prompt.empty() && prompt.back() != '\n') {
    prompt += "\n";
  }

  prompt += "\n# Working Environment\n";
  prompt += "- Current UTC time: " + utc_now() + "\n";
  prompt += "- Workspace root: " + workspace_root.string() + "\n\n";
  prompt += "# AGENTS.md Instructions\n";
  prompt += "AGENTS.md instructions take precedence over the defaults above when they conflict.\n\n";
  prompt += agents_text + "\n";
  return prompt;
}

}  // namespace codeloop
