#include "builtins.hpp"

namespace codeloop::tools {

// ============================================================================
// UpdatePlanTool
// ============================================================================

UpdatePlanTool::UpdatePlanTool()
    : SimpleTool("update_plan",
                 "Create or update the task plan for this session. Each call replaces the whole plan; "
                 "include every step with its current status. Use it for tasks with 3 or more steps.") {}

std::vector<ParameterSchema> UpdatePlanTool::parameters() const {
  json item = {{"type", "object"},
               {"properties",
                {{"step", {{"type", "string"}, {"description", "Concise description of the step."}}},
                 {"status", {{"type", "string"}, {"enum", {"pending", "in_progress", "completed"}}, {"description", "Current status."}}}}},
               {"required", {"step", "status"}},
               {"additionalProperties", false}};
  return {{"plan", "array", "Complete list of plan steps.", true, std::nullopt, std::nullopt, item}};
}

std::future<ToolResult> UpdatePlanTool::execute(const json &args, const ToolContext &ctx) {
  std::promise<ToolResult> promise;

  auto result = [&]() -> ToolResult {
    if (!args.contains("plan") || !args["plan"].is_array()) {
      return ToolResult::error("plan must be a list of {step, status}");
    }

    std::vector<PlanItem> plan;
    for (const auto &entry : args["plan"]) {
      if (!entry.is_object()) {
        return ToolResult::error("each plan item must be an object");
      }
      PlanItem item{entry.value("step", ""), entry.value("status", "")};
      item.step.erase(0, item.step.find_first_not_of(" \t\r\n"));
      item.step.erase(item.step.find_last_not_of(" \t\r\n") + 1);
      if (item.step.empty()) {
        return ToolResult::error("plan step cannot be empty");
      }
      if (item.status != "pending" && item.status != "in_progress" && item.status != "completed") {
        return ToolResult::error("status must be pending | in_progress | completed");
      }
      plan.push_back(std::move(item));
    }

    if (!ctx.update_plan) {
      return ToolResult::error("plan updates are not available in this session");
    }
    ctx.update_plan(plan);
    return ToolResult::success(json{{"ok", true}, {"plan_size", plan.size()}}.dump());
  }();

  promise.set_value(std::move(result));
  return promise.get_future();
}

// ============================================================================
// Registration
// ============================================================================

void register_builtins(ToolRegistry &registry) {
  registry.register_tool(std::make_shared<ListFilesTool>());
  registry.register_tool(std::make_shared<ReadFileTool>());
  registry.register_tool(std::make_shared<GrepFilesTool>());
  registry.register_tool(std::make_shared<WriteFileTool>());
  registry.register_tool(std::make_shared<ReplaceInFileTool>());
  registry.register_tool(std::make_shared<ExecCommandTool>());
  registry.register_tool(std::make_shared<UpdatePlanTool>());
}

}  // namespace codeloop::tools
