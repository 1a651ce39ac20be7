#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/types.hpp"

namespace codeloop {

// One entry of the session task plan
struct PlanItem {
  std::string step;
  std::string status;  // "pending", "in_progress" or "completed"
};

// Tool execution context, built per call by the agent loop
struct ToolContext {
  SessionId session_id;
  ToolCallId tool_call_id;

  std::filesystem::path workspace_root;
  SandboxMode sandbox_mode = SandboxMode::WorkspaceWrite;
  ApprovalPolicy approval_policy = ApprovalPolicy::OnRequest;

  // Set on session cancellation or when the call times out
  std::shared_ptr<std::atomic<bool>> abort_signal;

  // Replaces the session plan; serialized by the owning loop
  std::function<void(const std::vector<PlanItem> &plan)> update_plan;

  bool aborted() const {
    return abort_signal && abort_signal->load();
  }

  // Resolve a tool path argument against the workspace root.
  // Outside danger-full-access the result must stay inside the workspace.
  Result<std::filesystem::path> resolve_path(const std::string &raw) const;
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata = json::object();
  bool is_error = false;

  static ToolResult success(const std::string &output) {
    return ToolResult{output, std::nullopt, json::object(), false};
  }

  // Error kind lands in metadata["error_kind"]
  static ToolResult error(const std::string &message, ToolErrorKind kind = ToolErrorKind::HandlerFailure) {
    return ToolResult{message, std::nullopt, json{{"error_kind", to_string(kind)}}, true};
  }

  static ToolResult with_title(const std::string &output, const std::string &title) {
    return ToolResult{output, title, json::object(), false};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "integer", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
  std::optional<json> items;  // element schema for arrays

  json to_json_schema() const;
};

// Tool definition
class Tool {
 public:
  virtual ~Tool() = default;

  // Unique registry key
  virtual std::string name() const = 0;

  virtual std::string description() const = 0;

  virtual std::vector<ParameterSchema> parameters() const {
    return {};
  }

  // Object schema of the arguments, built from parameters() by default
  virtual json parameter_schema() const;

  // Mutating tools pass the sandbox and approval stages of the gate
  virtual bool mutating() const {
    return false;
  }

  // Upper bound enforced by the gate
  virtual std::chrono::seconds timeout(const json & /*args*/) const {
    return std::chrono::seconds(120);
  }

  // Argument names holding filesystem paths
  virtual std::vector<std::string> path_arguments() const {
    return {};
  }

  // Under on-request approval, ask again even if the tool was approved before
  virtual bool needs_confirmation(const json & /*args*/) const {
    return false;
  }

  virtual std::future<ToolResult> execute(const json &args, const ToolContext &ctx) = 0;

  // {name, description, parameters}, translated by each provider
  json to_json_schema() const;

  // Check arguments against parameter_schema()
  Result<json> validate_args(const json &args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description);

  std::string name() const override {
    return name_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string name_;
  std::string description_;
};

// Path helpers shared by the gate and the handlers
namespace paths {

// Absolute, lexically normal, symlinks of the existing prefix resolved
std::filesystem::path resolve(const std::filesystem::path &root, const std::string &raw);

// True when target lies at or below root; both must be resolved
bool is_within(const std::filesystem::path &root, const std::filesystem::path &target);

}  // namespace paths

// Integer argument clamped to [lo, hi] without narrowing first; fallback when absent
int clamp_int_arg(const json &args, const std::string &key, int fallback, int lo, int hi);

// Truncation helper
namespace Truncate {

// Cut to max_chars bytes on a UTF-8 boundary, appending "\n... (truncated)"
std::string chars(const std::string &text, size_t max_chars);

}  // namespace Truncate

}  // namespace codeloop
