#include "session/subagent.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace codeloop {

std::vector<SubagentProfile> default_profiles() {
  std::vector<std::string> read_only = {"list_files", "read_file", "grep_files"};
  return {
      {"general", "General-purpose delegate for focused task execution.",
       "You are a delegated helper agent. Focus only on the assigned sub-task, keep answers concise, and report concrete results.", read_only, 8,
       std::nullopt},
      {"reviewer", "Review code changes and identify bugs and risks.",
       "You are a code reviewer subagent. Prioritize correctness, regressions, and missing tests. Provide findings first, then a short summary.",
       read_only, 8, std::nullopt},
      {"researcher", "Inspect codebase context and summarize findings.",
       "You are a research subagent. Gather high-signal facts from files/tools, state assumptions clearly, and return a structured summary.",
       read_only, 8, std::nullopt},
  };
}

SubagentDelegator::SubagentDelegator(std::shared_ptr<llm::Provider> provider, const ToolRegistry &parent_tools, std::vector<SubagentProfile> profiles,
                                     LoopOptions parent_options)
    : provider_(std::move(provider)), parent_options_(std::move(parent_options)) {
  for (auto &profile : profiles) {
    if (bindings_.count(profile.name)) {
      throw ConfigError("duplicate subagent profile: " + profile.name);
    }

    for (const auto &tool_name : profile.allowed_tool_names) {
      if (tool_name == DELEGATE_TOOL_NAME) {
        throw ConfigError("subagent profile '" + profile.name + "' cannot use " + DELEGATE_TOOL_NAME + ": subagents do not delegate further");
      }
    }

    Binding binding;
    try {
      binding.tools = parent_tools.view(profile.allowed_tool_names);
    } catch (const ConfigError &e) {
      throw ConfigError("subagent profile '" + profile.name + "': " + e.what());
    }

    binding.sandbox_mode = profile.sandbox_mode.value_or(SandboxMode::ReadOnly);
    if (binding.sandbox_mode == SandboxMode::ReadOnly) {
      for (const auto &tool : binding.tools->all()) {
        if (tool->mutating()) {
          throw ConfigError("subagent profile '" + profile.name + "' is read-only but allows mutating tool " + tool->name());
        }
      }
    }

    profile.max_steps = std::max(1, profile.max_steps);
    spdlog::debug("[Subagent] bound profile {} with {} tool(s), sandbox {}", profile.name, binding.tools->size(), to_string(binding.sandbox_mode));
    binding.profile = std::move(profile);
    auto name = binding.profile.name;
    bindings_.emplace(name, std::move(binding));
  }
}

RunResult SubagentDelegator::run(const std::string &profile, const std::string &task, const std::string &context,
                                 const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  auto it = bindings_.find(profile);
  if (it == bindings_.end()) {
    throw ConfigError("unknown subagent profile: " + profile);
  }
  const auto &binding = it->second;

  LoopOptions options = parent_options_;
  options.system_prompt = parent_options_.system_prompt + "\n\n# Subagent profile: " + binding.profile.name + "\n" + binding.profile.instructions + "\n";
  options.max_steps = binding.profile.max_steps;
  options.sandbox_mode = binding.sandbox_mode;
  options.approval_policy = ApprovalPolicy::Never;
  options.confirm = nullptr;
  options.abort_signal = abort_signal;

  std::string prompt = task;
  if (!context.empty()) {
    prompt += "\n\n# Context from the parent agent\n" + context;
  }

  spdlog::info("[Subagent] running profile {} (max_steps={})", profile, options.max_steps);
  AgentLoop loop(provider_, binding.tools, std::move(options));
  return loop.run(prompt);
}

ToolResult SubagentDelegator::run_as_tool(const std::string &profile, const std::string &task, const std::string &context,
                                          const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  if (!bindings_.count(profile)) {
    std::string available;
    for (const auto &name : profile_names()) {
      available += (available.empty() ? "" : ", ") + name;
    }
    return ToolResult::error("unknown subagent profile: " + profile + " (available: " + available + ")");
  }

  RunResult result;
  try {
    result = run(profile, task, context, abort_signal);
  } catch (const std::exception &e) {
    spdlog::error("[Subagent] {} failed: {}", profile, e.what());
    return ToolResult::error("subagent " + profile + " failed: " + e.what());
  }

  std::string title = "Subagent: " + profile;
  switch (result.reason) {
    case TerminationReason::Done:
      return ToolResult::with_title(result.final_answer.empty() ? "(subagent returned no answer)" : result.final_answer, title);

    case TerminationReason::MaxStepsExceeded: {
      // Best partial answer: last assistant text the model wrote itself
      std::string partial;
      for (auto msg = result.transcript.rbegin(); msg != result.transcript.rend(); ++msg) {
        if (msg->role() == Role::Assistant && !msg->is_synthetic() && !msg->text().empty()) {
          partial = msg->text();
          break;
        }
      }
      std::string output = "Subagent " + profile + " stopped after " + std::to_string(result.steps) + " steps without finishing.";
      if (!partial.empty()) {
        output += "\nLast progress:\n" + partial;
      }
      return ToolResult::with_title(output, title);
    }

    case TerminationReason::Error:
      return ToolResult::error("subagent " + profile + " failed: " + result.error.value_or("unknown error"));

    case TerminationReason::Cancelled:
      return ToolResult::error("Cancelled");
  }
  return ToolResult::error("subagent " + profile + " ended in an unknown state");
}

std::string SubagentDelegator::delegate(const std::string &profile, const std::string &task, const std::string &context,
                                        const std::shared_ptr<std::atomic<bool>> &abort_signal) {
  return run_as_tool(profile, task, context, abort_signal).output;
}

std::vector<std::string> SubagentDelegator::profile_names() const {
  std::vector<std::string> names;
  for (const auto &[name, _] : bindings_) {
    names.push_back(name);
  }
  return names;
}

const SubagentProfile *SubagentDelegator::find(const std::string &name) const {
  auto it = bindings_.find(name);
  return it == bindings_.end() ? nullptr : &it->second.profile;
}

SandboxMode SubagentDelegator::sandbox_mode(const std::string &name) const {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    throw ConfigError("unknown subagent profile: " + name);
  }
  return it->second.sandbox_mode;
}

}  // namespace codeloop
