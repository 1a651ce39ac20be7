#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "tool/registry.hpp"
#include "tool/sandbox_gate.hpp"

namespace codeloop {

// Loop state
enum class LoopState { AwaitingModel, AwaitingToolResults, Terminated };

std::string to_string(LoopState state);

// Why a run stopped
enum class TerminationReason { Done, MaxStepsExceeded, Error, Cancelled };

std::string to_string(TerminationReason reason);

// Owned by exactly one loop; mutated only by it
struct AgentState {
  std::vector<Message> messages;
  int step = 0;
  int max_steps = 20;
  std::vector<PlanItem> plan;
};

// Per-session settings; immutable once the loop is built
struct LoopOptions {
  std::string model;
  std::string system_prompt;

  int max_steps = 20;
  int max_parallel_tools = 4;

  std::optional<double> temperature;
  std::optional<int> max_tokens;

  std::filesystem::path workspace_root = std::filesystem::current_path();
  SandboxMode sandbox_mode = SandboxMode::WorkspaceWrite;
  ApprovalPolicy approval_policy = ApprovalPolicy::OnRequest;
  ConfirmFn confirm;

  // Shared with a parent when the loop runs as a subagent
  std::shared_ptr<std::atomic<bool>> abort_signal;

  static LoopOptions from_config(const Config &config);
};

// Outcome of one run; the transcript is kept whatever the reason
struct RunResult {
  TerminationReason reason = TerminationReason::Done;
  std::string final_answer;
  std::vector<Message> transcript;
  std::vector<PlanItem> plan;
  int steps = 0;
  TokenUsage usage;

  // Set when reason is Error
  std::optional<std::string> error;
  std::optional<ProviderErrorKind> error_kind;

  bool ok() const {
    return reason == TerminationReason::Done;
  }
};

// Step state machine: model call, tool batch, repeat.
// Results of one batch are appended in emission order whatever order the
// workers finish in. max_steps is checked before every model call.
class AgentLoop {
 public:
  AgentLoop(std::shared_ptr<llm::Provider> provider, std::shared_ptr<ToolRegistry> registry, LoopOptions options);

  const SessionId &id() const {
    return id_;
  }

  // Append messages and run until termination
  RunResult run(std::vector<Message> messages);

  RunResult run(const std::string &user_text);

  // Observable by in-flight model calls and tool handlers
  void cancel();

  LoopState loop_state() const {
    return loop_state_.load();
  }

  const AgentState &state() const {
    return state_;
  }

  const LoopOptions &options() const {
    return options_;
  }

  // Event callbacks, invoked on the loop thread
  using OnMessageCallback = std::function<void(const Message &)>;
  using OnReasoningCallback = std::function<void(const std::string &text)>;
  using OnToolCallCallback = std::function<void(const ToolCallPart &call)>;
  using OnToolResultCallback = std::function<void(const ToolCallPart &call, const ToolResult &result)>;

  void on_message(OnMessageCallback cb) {
    on_message_ = std::move(cb);
  }

  void on_reasoning(OnReasoningCallback cb) {
    on_reasoning_ = std::move(cb);
  }

  void on_tool_call(OnToolCallCallback cb) {
    on_tool_call_ = std::move(cb);
  }

  void on_tool_result(OnToolResultCallback cb) {
    on_tool_result_ = std::move(cb);
  }

 private:
  void add_message(Message msg);

  // Runs one batch on at most max_parallel_tools workers, results in call order
  std::vector<ToolResult> execute_tool_calls(const std::vector<ToolCallPart> &calls);

  RunResult finish(TerminationReason reason, std::string answer);

  bool aborted() const {
    return abort_signal_->load();
  }

  SessionId id_;
  std::shared_ptr<llm::Provider> provider_;
  std::shared_ptr<ToolRegistry> registry_;
  LoopOptions options_;
  SandboxGate gate_;

  AgentState state_;
  std::mutex plan_mutex_;
  std::atomic<LoopState> loop_state_{LoopState::AwaitingModel};
  std::shared_ptr<std::atomic<bool>> abort_signal_;
  bool owns_abort_signal_ = true;

  TokenUsage run_usage_;
  std::optional<std::string> error_;
  std::optional<ProviderErrorKind> error_kind_;

  OnMessageCallback on_message_;
  OnReasoningCallback on_reasoning_;
  OnToolCallCallback on_tool_call_;
  OnToolResultCallback on_tool_result_;
};

}  // namespace codeloop
