#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "core/message.hpp"
#include "tool/registry.hpp"
#include "tool/tool.hpp"

namespace codeloop {

// Asks a human whether a mutating call may run; false declines
using ConfirmFn = std::function<bool(const std::string &tool_name, const json &args)>;

// Session-scoped policy read by the gate on every call
struct GateContext {
  SessionId session_id;
  SandboxMode sandbox_mode = SandboxMode::WorkspaceWrite;
  ApprovalPolicy approval_policy = ApprovalPolicy::OnRequest;
  std::filesystem::path workspace_root;

  // Missing callback counts as a declined confirmation
  ConfirmFn confirm;

  // Session cancellation, observed while a handler runs
  std::shared_ptr<std::atomic<bool>> abort_signal;

  std::function<void(const std::vector<PlanItem> &plan)> update_plan;
};

// Single entry point for running a tool call.
// Stages run in order: lookup, schema, sandbox, approval, execution with a
// timeout. Every failure comes back as an error ToolResult, nothing throws.
class SandboxGate {
 public:
  explicit SandboxGate(std::shared_ptr<ToolRegistry> registry);

  ToolResult execute(const ToolCallPart &call, const GateContext &ctx);

  const std::shared_ptr<ToolRegistry> &registry() const {
    return registry_;
  }

  // Slice used while polling a running handler for cancellation
  static constexpr std::chrono::milliseconds POLL_INTERVAL{50};

 private:
  std::optional<ToolResult> check_sandbox(const Tool &tool, const json &args, const GateContext &ctx) const;
  std::optional<ToolResult> check_approval(const Tool &tool, const json &args, const GateContext &ctx);
  ToolResult run(const std::shared_ptr<Tool> &tool, const ToolCallPart &call, const GateContext &ctx);

  std::shared_ptr<ToolRegistry> registry_;

  // Tool names confirmed once under on-request
  std::mutex approved_mutex_;
  std::set<std::string> approved_;

  // Held across a confirm prompt so prompts never overlap
  std::mutex confirm_mutex_;
};

}  // namespace codeloop
