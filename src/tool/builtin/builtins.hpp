#pragma once

#include <functional>

#include "tool/registry.hpp"
#include "tool/tool.hpp"

namespace codeloop::tools {

// list_files - list directory entries relative to the workspace
class ListFilesTool : public SimpleTool {
 public:
  ListFilesTool();

  std::vector<ParameterSchema> parameters() const override;
  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// read_file - line-numbered file slice
class ReadFileTool : public SimpleTool {
 public:
  ReadFileTool();

  std::vector<ParameterSchema> parameters() const override;
  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// grep_files - regex search over file contents
class GrepFilesTool : public SimpleTool {
 public:
  GrepFilesTool();

  std::vector<ParameterSchema> parameters() const override;
  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// write_file - create, overwrite or append
class WriteFileTool : public SimpleTool {
 public:
  WriteFileTool();

  std::vector<ParameterSchema> parameters() const override;
  bool mutating() const override {
    return true;
  }
  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// replace_in_file - exact text replacement
class ReplaceInFileTool : public SimpleTool {
 public:
  ReplaceInFileTool();

  std::vector<ParameterSchema> parameters() const override;
  bool mutating() const override {
    return true;
  }
  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// exec_command - shell command in the workspace
class ExecCommandTool : public SimpleTool {
 public:
  ExecCommandTool();

  std::vector<ParameterSchema> parameters() const override;
  bool mutating() const override {
    return true;
  }
  std::chrono::seconds timeout(const json &args) const override;
  std::vector<std::string> path_arguments() const override {
    return {"workdir"};
  }
  bool needs_confirmation(const json &args) const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

  static constexpr int DEFAULT_TIMEOUT_SEC = 120;
  static constexpr int MAX_TIMEOUT_SEC = 1800;
  static constexpr size_t MAX_OUTPUT_CHARS = 6000;
};

// True for commands that destroy data (rm -rf, git reset --hard, ...)
bool is_destructive_command(const std::string &command);

// update_plan - replace the session plan
class UpdatePlanTool : public SimpleTool {
 public:
  UpdatePlanTool();

  std::vector<ParameterSchema> parameters() const override;
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;
};

// delegate_task - run a restricted subagent and return its answer
class DelegateTaskTool : public SimpleTool {
 public:
  // (profile, task, context, abort) -> subagent outcome as a tool result
  using Runner = std::function<ToolResult(const std::string &profile, const std::string &task, const std::string &context,
                                          const std::shared_ptr<std::atomic<bool>> &abort_signal)>;

  DelegateTaskTool(Runner runner, std::vector<std::string> profile_names, std::chrono::seconds timeout = std::chrono::seconds(900));

  std::vector<ParameterSchema> parameters() const override;
  std::chrono::seconds timeout(const json &) const override {
    return timeout_;
  }
  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

 private:
  Runner runner_;
  std::vector<std::string> profile_names_;
  std::chrono::seconds timeout_;
};

// Registers list_files, read_file, grep_files, write_file, replace_in_file,
// exec_command and update_plan. Throws ConfigError on name collisions.
void register_builtins(ToolRegistry &registry);

}  // namespace codeloop::tools
