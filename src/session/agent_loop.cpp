#include "session/agent_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

#include "bus/bus.hpp"

namespace codeloop {

std::string to_string(LoopState state) {
  switch (state) {
    case LoopState::AwaitingModel:
      return "awaiting_model";
    case LoopState::AwaitingToolResults:
      return "awaiting_tool_results";
    case LoopState::Terminated:
      return "terminated";
  }
  return "unknown";
}

std::string to_string(TerminationReason reason) {
  switch (reason) {
    case TerminationReason::Done:
      return "done";
    case TerminationReason::MaxStepsExceeded:
      return "max_steps_exceeded";
    case TerminationReason::Error:
      return "error";
    case TerminationReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

LoopOptions LoopOptions::from_config(const Config &config) {
  LoopOptions options;
  options.model = config.model;
  options.system_prompt = config.system_prompt;
  options.max_steps = config.max_steps;
  options.max_parallel_tools = config.max_parallel_tools;
  options.temperature = config.temperature;
  options.max_tokens = config.max_tokens;
  options.workspace_root = config.workspace_root;
  options.sandbox_mode = config.sandbox_mode;
  options.approval_policy = config.approval_policy;
  return options;
}

AgentLoop::AgentLoop(std::shared_ptr<llm::Provider> provider, std::shared_ptr<ToolRegistry> registry, LoopOptions options)
    : id_(UUID::generate()),
      provider_(std::move(provider)),
      registry_(std::move(registry)),
      options_(std::move(options)),
      gate_(registry_),
      abort_signal_(options_.abort_signal) {
  if (!abort_signal_) {
    abort_signal_ = std::make_shared<std::atomic<bool>>(false);
  } else {
    owns_abort_signal_ = false;
  }
  options_.max_steps = std::max(1, options_.max_steps);
  options_.max_parallel_tools = std::max(1, options_.max_parallel_tools);
  state_.max_steps = options_.max_steps;
}

RunResult AgentLoop::run(const std::string &user_text) {
  return run({Message::user(user_text)});
}

RunResult AgentLoop::run(std::vector<Message> messages) {
  if (owns_abort_signal_) {
    abort_signal_->store(false);
  }
  state_.step = 0;
  run_usage_ = TokenUsage{};
  error_.reset();
  error_kind_.reset();
  loop_state_ = LoopState::AwaitingModel;

  Bus::instance().publish(events::SessionStarted{id_, provider_ ? provider_->name() : "", options_.model});

  for (auto &msg : messages) {
    add_message(std::move(msg));
  }

  if (!provider_) {
    error_ = "no model provider configured";
    return finish(TerminationReason::Error, "");
  }

  while (true) {
    if (aborted()) {
      return finish(TerminationReason::Cancelled, "");
    }

    if (state_.step >= state_.max_steps) {
      spdlog::info("[AgentLoop {}] step limit {} reached", id_, state_.max_steps);
      auto closing = Message::assistant("Stopped after reaching the step limit (" + std::to_string(state_.max_steps) +
                                        " steps) before the task was finished. The transcript above holds the work done so far.");
      closing.set_synthetic(true);
      closing.set_finish_reason(FinishReason::Length);
      auto text = closing.text();
      add_message(std::move(closing));
      return finish(TerminationReason::MaxStepsExceeded, text);
    }

    // Awaiting Model
    llm::LlmRequest request;
    request.model = options_.model;
    request.system_prompt = options_.system_prompt;
    request.messages = state_.messages;
    request.tools = registry_->all();
    request.temperature = options_.temperature;
    request.max_tokens = options_.max_tokens;

    spdlog::debug("[AgentLoop {}] step {}: model={} messages={} tools={}", id_, state_.step + 1, request.model, request.messages.size(),
                  request.tools.size());

    llm::LlmResponse response;
    try {
      response = provider_->send(request, abort_signal_);
    } catch (const CancelledError &) {
      return finish(TerminationReason::Cancelled, "");
    } catch (const ProviderError &e) {
      spdlog::error("[AgentLoop {}] provider error ({}): {}", id_, to_string(e.kind()), e.what());
      error_ = e.what();
      error_kind_ = e.kind();
      return finish(TerminationReason::Error, "");
    } catch (const std::exception &e) {
      spdlog::error("[AgentLoop {}] provider failure: {}", id_, e.what());
      error_ = e.what();
      return finish(TerminationReason::Error, "");
    }

    run_usage_ += response.usage;
    Bus::instance().publish(events::TokensUsed{id_, response.usage.input_tokens, response.usage.output_tokens});

    if (auto reasoning = response.message.reasoning(); reasoning && on_reasoning_) {
      on_reasoning_(*reasoning);
    }

    // Copy the calls before the message moves into history
    std::vector<ToolCallPart> calls;
    for (const auto *tc : response.message.tool_calls()) {
      calls.push_back(*tc);
    }
    auto answer = response.message.text();
    add_message(std::move(response.message));

    if (calls.empty()) {
      return finish(TerminationReason::Done, answer);
    }

    // Awaiting Tool Results
    loop_state_ = LoopState::AwaitingToolResults;
    auto results = execute_tool_calls(calls);

    for (size_t i = 0; i < calls.size(); ++i) {
      const auto &result = results[i];
      add_message(Message::tool_result(calls[i].id, calls[i].name, result.output, result.is_error, result.metadata));
    }

    state_.step++;
    loop_state_ = LoopState::AwaitingModel;
  }
}

std::vector<ToolResult> AgentLoop::execute_tool_calls(const std::vector<ToolCallPart> &calls) {
  GateContext ctx;
  ctx.session_id = id_;
  ctx.sandbox_mode = options_.sandbox_mode;
  ctx.approval_policy = options_.approval_policy;
  ctx.workspace_root = options_.workspace_root;
  ctx.confirm = options_.confirm;
  ctx.abort_signal = abort_signal_;
  ctx.update_plan = [this](const std::vector<PlanItem> &plan) {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    state_.plan = plan;
    Bus::instance().publish(events::PlanUpdated{id_, plan.size()});
  };

  for (const auto &call : calls) {
    spdlog::debug("[AgentLoop {}] tool call {} {} {}", id_, call.id, call.name, call.arguments.dump());
    if (on_tool_call_) {
      on_tool_call_(call);
    }
    Bus::instance().publish(events::ToolCallStarted{id_, call.id, call.name});
  }

  // One slot per call, indexed by emission order
  std::vector<ToolResult> slots(calls.size());
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < calls.size(); i = next.fetch_add(1)) {
      slots[i] = gate_.execute(calls[i], ctx);
    }
  };

  size_t workers = std::min(calls.size(), static_cast<size_t>(options_.max_parallel_tools));
  if (workers <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
    for (auto &t : pool) {
      t.join();
    }
  }

  for (size_t i = 0; i < calls.size(); ++i) {
    if (on_tool_result_) {
      on_tool_result_(calls[i], slots[i]);
    }
    Bus::instance().publish(events::ToolCallCompleted{id_, calls[i].id, calls[i].name, slots[i].is_error});
  }

  return slots;
}

void AgentLoop::add_message(Message msg) {
  state_.messages.push_back(std::move(msg));
  const auto &added = state_.messages.back();

  Bus::instance().publish(events::MessageAdded{id_, added.id(), to_string(added.role())});

  if (on_message_) {
    on_message_(added);
  }
}

RunResult AgentLoop::finish(TerminationReason reason, std::string answer) {
  loop_state_ = LoopState::Terminated;

  RunResult result;
  result.reason = reason;
  result.final_answer = std::move(answer);
  result.transcript = state_.messages;
  {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    result.plan = state_.plan;
  }
  result.steps = state_.step;
  result.usage = run_usage_;
  result.error = error_;
  result.error_kind = error_kind_;

  spdlog::info("[AgentLoop {}] terminated: {} after {} step(s)", id_, to_string(reason), state_.step);
  Bus::instance().publish(events::SessionEnded{id_, to_string(reason), state_.step});
  return result;
}

void AgentLoop::cancel() {
  spdlog::info("[AgentLoop {}] cancel requested", id_);
  abort_signal_->store(true);
}

}  // namespace codeloop
