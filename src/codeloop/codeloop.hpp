#pragma once

// Core types
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Event bus
#include "bus/bus.hpp"

// Network
#include "net/http_client.hpp"

// LLM providers
#include "llm/provider.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/process_tool.hpp"
#include "tool/registry.hpp"
#include "tool/sandbox_gate.hpp"
#include "tool/tool.hpp"

// Agent loop
#include "session/agent_loop.hpp"
#include "session/subagent.hpp"
#include "session/system_prompt.hpp"

namespace codeloop {

// Initialize logging from the configuration
void init(const Config &config);

// Get version string
std::string version();

// Everything one configuration needs to run agent loops: provider,
// tool registry with built-ins, external tools and delegate_task, and the
// subagent delegator. Built once; each task gets its own AgentLoop.
class Runtime {
 public:
  // Provider from the configured name; the caller runs io_ctx.
  // Throws ConfigError on any invalid setting.
  static std::shared_ptr<Runtime> create(const Config &config, asio::io_context &io_ctx);

  // Same with an externally built provider
  static std::shared_ptr<Runtime> create(const Config &config, std::shared_ptr<llm::Provider> provider);

  // Fresh loop over the shared registry
  std::unique_ptr<AgentLoop> new_loop(ConfirmFn confirm = nullptr) const;

  RunResult run_task(const std::string &task, ConfirmFn confirm = nullptr) const;

  const Config &config() const {
    return config_;
  }

  const std::shared_ptr<llm::Provider> &provider() const {
    return provider_;
  }

  const std::shared_ptr<ToolRegistry> &registry() const {
    return registry_;
  }

  const std::shared_ptr<SubagentDelegator> &delegator() const {
    return delegator_;
  }

  const std::string &system_prompt() const {
    return system_prompt_;
  }

 private:
  Runtime(Config config, std::shared_ptr<llm::Provider> provider);

  Config config_;
  std::shared_ptr<llm::Provider> provider_;
  std::shared_ptr<ToolRegistry> registry_;
  std::shared_ptr<SubagentDelegator> delegator_;
  std::string system_prompt_;
};

}  // namespace codeloop
