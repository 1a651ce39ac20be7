#include <spdlog/spdlog.h>

#include "builtins.hpp"

namespace codeloop::tools {

// ============================================================================
// DelegateTaskTool
// ============================================================================

DelegateTaskTool::DelegateTaskTool(Runner runner, std::vector<std::string> profile_names, std::chrono::seconds timeout)
    : SimpleTool("delegate_task",
                 "Delegate a focused sub-task to a read-only subagent and return its final answer. "
                 "Several delegations in one turn run in parallel."),
      runner_(std::move(runner)),
      profile_names_(std::move(profile_names)),
      timeout_(timeout) {}

std::vector<ParameterSchema> DelegateTaskTool::parameters() const {
  std::optional<std::vector<std::string>> profiles;
  if (!profile_names_.empty()) {
    profiles = profile_names_;
  }
  return {{"task", "string", "The sub-task for the subagent.", true, std::nullopt, std::nullopt},
          {"profile", "string", "Subagent profile.", false, json("general"), profiles},
          {"context", "string", "Extra context shared with the subagent.", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> DelegateTaskTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [this, args, ctx]() -> ToolResult {
    std::string task = args.value("task", "");
    std::string profile = args.value("profile", "general");
    std::string context = args.value("context", "");

    if (task.find_first_not_of(" \t\r\n") == std::string::npos) {
      return ToolResult::error("task cannot be empty");
    }
    if (!runner_) {
      return ToolResult::error("delegation is not available in this session");
    }
    if (ctx.aborted()) {
      return ToolResult::error("Cancelled");
    }

    spdlog::debug("[DelegateTask] profile={} task=\"{}\"", profile, task.substr(0, 80));
    auto result = runner_(profile, task, context, ctx.abort_signal);
    if (!result.title) {
      result.title = "Subagent: " + profile;
    }
    return result;
  });
}

}  // namespace codeloop::tools
