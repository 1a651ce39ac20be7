#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

#include "builtins.hpp"
#include "tool/process.hpp"

namespace codeloop::tools {

// ============================================================================
// ExecCommandTool
// ============================================================================

ExecCommandTool::ExecCommandTool()
    : SimpleTool("exec_command",
                 "Execute a shell command and return its exit code and combined stdout/stderr. MUTATING. "
                 "Use it for tests, builds, git and package management; use list_files, read_file and grep_files "
                 "for browsing code.") {}

std::vector<ParameterSchema> ExecCommandTool::parameters() const {
  return {{"command", "string", "Shell command, run with /bin/sh -c.", true, std::nullopt, std::nullopt},
          {"timeout_sec", "integer", "Timeout in seconds. Defaults to 120. Range: 1-1800.", false, json(DEFAULT_TIMEOUT_SEC), std::nullopt},
          {"workdir", "string", "Working directory. Defaults to the workspace root.", false, std::nullopt, std::nullopt}};
}

std::chrono::seconds ExecCommandTool::timeout(const json &args) const {
  int timeout_sec = clamp_int_arg(args, "timeout_sec", DEFAULT_TIMEOUT_SEC, 1, MAX_TIMEOUT_SEC);
  // Grace for the kill sequence inside the handler
  return std::chrono::seconds(timeout_sec + 5);
}

bool ExecCommandTool::needs_confirmation(const json &args) const {
  return args.is_object() && args.contains("command") && args["command"].is_string() &&
         is_destructive_command(args["command"].get<std::string>());
}

bool is_destructive_command(const std::string &command) {
  static const std::regex patterns[] = {
      std::regex(R"(\brm\s+(-[a-zA-Z]*r[a-zA-Z]*f|-[a-zA-Z]*f[a-zA-Z]*r)\b)"),
      std::regex(R"(\bgit\s+reset\s+--hard\b)"),
      std::regex(R"(\bgit\s+push\s+(.*\s)?(--force|-f)\b)"),
      std::regex(R"(\bmkfs(\.\w+)?\b)"),
      std::regex(R"(\bdd\s+if=)"),
  };
  for (const auto &re : patterns) {
    if (std::regex_search(command, re)) return true;
  }
  return false;
}

std::future<ToolResult> ExecCommandTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string command = args.value("command", "");
    int timeout_sec = clamp_int_arg(args, "timeout_sec", DEFAULT_TIMEOUT_SEC, 1, MAX_TIMEOUT_SEC);

    if (command.empty()) {
      return ToolResult::error("command is required");
    }

    auto resolved = ctx.resolve_path(args.value("workdir", "."));
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }

    if (ctx.aborted()) {
      return ToolResult::error("Cancelled");
    }

    spdlog::debug("[ExecCommand] Executing: command=\"{}\", workdir=\"{}\", timeout={}s", command, resolved.value->string(), timeout_sec);

    ProcessOptions options;
    options.argv = {"/bin/sh", "-c", command};
    options.workdir = *resolved.value;
    options.timeout = std::chrono::seconds(timeout_sec);
    options.merge_stderr = true;
    options.abort_signal = ctx.abort_signal;

    auto proc = run_process(options);
    if (!proc.spawned()) {
      return ToolResult::error(proc.error);
    }
    if (proc.cancelled) {
      spdlog::warn("[ExecCommand] Execution cancelled");
      return ToolResult::error("Cancelled");
    }

    std::string output = proc.out;
    output.erase(0, output.find_first_not_of(" \t\r\n"));
    output.erase(output.find_last_not_of(" \t\r\n") + 1);
    if (proc.timed_out) {
      spdlog::warn("[ExecCommand] Command timed out after {}s", timeout_sec);
      output += "\n[Timed out after " + std::to_string(timeout_sec) + "s]";
    }

    std::string rendered = "exit_code=" + std::to_string(proc.exit_code) + "\n" + Truncate::chars(output, MAX_OUTPUT_CHARS);
    spdlog::debug("[ExecCommand] exit code {}, {} bytes of output", proc.exit_code, output.size());

    // A non-zero exit is reported, not treated as a handler failure
    ToolResult result = ToolResult::with_title(rendered, "Executed: " + command.substr(0, 50));
    result.metadata["exit_code"] = proc.exit_code;
    if (proc.timed_out) {
      result.is_error = true;
      result.metadata["error_kind"] = to_string(ToolErrorKind::Timeout);
    }
    return result;
  });
}

}  // namespace codeloop::tools
