#include "tool/sandbox_gate.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace codeloop {

namespace {

// Keep a timed-out handler alive until it finishes; the future's destructor
// would otherwise block the loop
void detach_future(std::shared_ptr<Tool> tool, std::future<ToolResult> future) {
  std::thread([tool = std::move(tool), future = std::move(future)]() mutable {
    try {
      future.get();
    } catch (const std::exception &e) {
      spdlog::debug("[SandboxGate] detached {} finished with: {}", tool->name(), e.what());
    }
  }).detach();
}

}  // namespace

SandboxGate::SandboxGate(std::shared_ptr<ToolRegistry> registry) : registry_(std::move(registry)) {}

ToolResult SandboxGate::execute(const ToolCallPart &call, const GateContext &ctx) {
  auto tool = registry_->get(call.name);
  if (!tool) {
    spdlog::warn("[SandboxGate] unknown tool {}", call.name);
    return ToolResult::error("Unknown tool: " + call.name, ToolErrorKind::UnknownTool);
  }

  auto validated = tool->validate_args(call.arguments);
  if (!validated.ok()) {
    spdlog::info("[SandboxGate] {} rejected: {}", call.name, *validated.error);
    return ToolResult::error("Invalid arguments for " + call.name + ": " + *validated.error, ToolErrorKind::SchemaInvalid);
  }

  if (tool->mutating()) {
    if (auto denied = check_sandbox(*tool, call.arguments, ctx)) {
      return *denied;
    }
    if (auto denied = check_approval(*tool, call.arguments, ctx)) {
      return *denied;
    }
  }

  return run(tool, call, ctx);
}

std::optional<ToolResult> SandboxGate::check_sandbox(const Tool &tool, const json &args, const GateContext &ctx) const {
  switch (ctx.sandbox_mode) {
    case SandboxMode::ReadOnly:
      spdlog::info("[SandboxGate] {} refused in read-only mode", tool.name());
      return ToolResult::error("Tool " + tool.name() + " modifies the system and is refused in read-only sandbox mode; it requires " +
                                   to_string(SandboxMode::WorkspaceWrite) + " or " + to_string(SandboxMode::DangerFullAccess),
                               ToolErrorKind::SandboxDenied);

    case SandboxMode::WorkspaceWrite: {
      auto root = paths::resolve(ctx.workspace_root, ".");
      for (const auto &key : tool.path_arguments()) {
        auto it = args.find(key);
        if (it == args.end() || !it->is_string()) continue;
        auto raw = it->get<std::string>();
        auto resolved = paths::resolve(root, raw);
        if (!paths::is_within(root, resolved)) {
          spdlog::info("[SandboxGate] {} path {} escapes {}", tool.name(), resolved.string(), root.string());
          return ToolResult::error("Sandbox denied " + tool.name() + ": path '" + raw + "' resolves outside the workspace root " + root.string(),
                                   ToolErrorKind::SandboxDenied);
        }
      }
      return std::nullopt;
    }

    case SandboxMode::DangerFullAccess:
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<ToolResult> SandboxGate::check_approval(const Tool &tool, const json &args, const GateContext &ctx) {
  if (ctx.approval_policy == ApprovalPolicy::Never) {
    return std::nullopt;
  }

  auto already_approved = [&]() {
    if (ctx.approval_policy != ApprovalPolicy::OnRequest || tool.needs_confirmation(args)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(approved_mutex_);
    return approved_.count(tool.name()) > 0;
  };

  if (already_approved()) {
    return std::nullopt;
  }

  // One prompt at a time; a parallel call to the same tool may have been
  // approved while this one waited
  std::lock_guard<std::mutex> prompt_lock(confirm_mutex_);
  if (already_approved()) {
    return std::nullopt;
  }

  bool approved = false;
  if (ctx.confirm) {
    try {
      approved = ctx.confirm(tool.name(), args);
    } catch (const std::exception &e) {
      spdlog::error("[SandboxGate] confirm callback failed: {}", e.what());
      approved = false;
    }
  }

  if (!approved) {
    spdlog::info("[SandboxGate] {} denied by user", tool.name());
    return ToolResult::error("Tool call " + tool.name() + " denied by user", ToolErrorKind::ApprovalDenied);
  }

  if (ctx.approval_policy == ApprovalPolicy::OnRequest) {
    std::lock_guard<std::mutex> lock(approved_mutex_);
    approved_.insert(tool.name());
  }
  return std::nullopt;
}

ToolResult SandboxGate::run(const std::shared_ptr<Tool> &tool, const ToolCallPart &call, const GateContext &ctx) {
  // Own flag per call so a timeout aborts this handler only
  auto call_abort = std::make_shared<std::atomic<bool>>(false);

  ToolContext tool_ctx;
  tool_ctx.session_id = ctx.session_id;
  tool_ctx.tool_call_id = call.id;
  tool_ctx.workspace_root = ctx.workspace_root;
  tool_ctx.sandbox_mode = ctx.sandbox_mode;
  tool_ctx.approval_policy = ctx.approval_policy;
  tool_ctx.abort_signal = call_abort;
  tool_ctx.update_plan = ctx.update_plan;

  auto limit = tool->timeout(call.arguments);
  auto deadline = std::chrono::steady_clock::now() + limit;

  std::future<ToolResult> future;
  try {
    future = tool->execute(call.arguments, tool_ctx);
  } catch (const std::exception &e) {
    spdlog::error("[SandboxGate] {} failed to start: {}", call.name, e.what());
    return ToolResult::error(call.name + " failed: " + e.what());
  }

  while (future.wait_for(POLL_INTERVAL) != std::future_status::ready) {
    if (ctx.abort_signal && ctx.abort_signal->load()) {
      call_abort->store(true);
      detach_future(tool, std::move(future));
      return ToolResult::error("Cancelled", ToolErrorKind::HandlerFailure);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      spdlog::warn("[SandboxGate] {} timed out after {}s", call.name, limit.count());
      call_abort->store(true);
      detach_future(tool, std::move(future));
      return ToolResult::error(call.name + " timed out after " + std::to_string(limit.count()) + "s", ToolErrorKind::Timeout);
    }
  }

  try {
    auto result = future.get();
    if (result.is_error && !result.metadata.contains("error_kind")) {
      result.metadata["error_kind"] = to_string(ToolErrorKind::HandlerFailure);
    }
    return result;
  } catch (const std::exception &e) {
    spdlog::error("[SandboxGate] {} threw: {}", call.name, e.what());
    return ToolResult::error(call.name + " failed: " + e.what());
  }
}

}  // namespace codeloop
