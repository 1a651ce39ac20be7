#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "llm/provider.hpp"
#include "session/agent_loop.hpp"
#include "tool/registry.hpp"

namespace codeloop {

// general, reviewer and researcher, limited to the read-only file tools
std::vector<SubagentProfile> default_profiles();

// Runs sub-tasks on fresh, restricted agent loops.
// Every profile is bound to its tool view at construction, so a bad catalog
// fails before any delegation. Nesting is one level: delegate_task is never
// available to a subagent.
class SubagentDelegator {
 public:
  // Throws ConfigError on duplicate profiles, unknown or forbidden tools,
  // and mutating tools in a read-only profile
  SubagentDelegator(std::shared_ptr<llm::Provider> provider, const ToolRegistry &parent_tools, std::vector<SubagentProfile> profiles,
                    LoopOptions parent_options);

  // Full outcome of one delegation
  RunResult run(const std::string &profile, const std::string &task, const std::string &context = "",
                const std::shared_ptr<std::atomic<bool>> &abort_signal = nullptr);

  // Outcome as a tool result for the parent turn; never throws
  ToolResult run_as_tool(const std::string &profile, const std::string &task, const std::string &context,
                         const std::shared_ptr<std::atomic<bool>> &abort_signal);

  // Final answer, or a textual description of the failure
  std::string delegate(const std::string &profile, const std::string &task, const std::string &context = "",
                       const std::shared_ptr<std::atomic<bool>> &abort_signal = nullptr);

  std::vector<std::string> profile_names() const;

  const SubagentProfile *find(const std::string &name) const;

  // Effective sandbox of a bound profile
  SandboxMode sandbox_mode(const std::string &name) const;

  static constexpr const char *DELEGATE_TOOL_NAME = "delegate_task";

 private:
  struct Binding {
    SubagentProfile profile;
    std::shared_ptr<ToolRegistry> tools;
    SandboxMode sandbox_mode = SandboxMode::ReadOnly;
  };

  std::shared_ptr<llm::Provider> provider_;
  LoopOptions parent_options_;
  std::map<std::string, Binding> bindings_;
};

}  // namespace codeloop
