#include <gtest/gtest.h>

#include "bus/bus.hpp"
#include "session/agent_loop.hpp"
#include "test_helpers.hpp"
#include "tool/builtin/builtins.hpp"

using namespace codeloop;
using codeloop::test::FakeTool;
using codeloop::test::ScriptedProvider;
using codeloop::test::TempDir;
using codeloop::test::text_reply;
using codeloop::test::tool_reply;

class AgentLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<ScriptedProvider>();
    registry_ = std::make_shared<ToolRegistry>();

    options_.model = "test-model";
    options_.system_prompt = "system";
    options_.workspace_root = dir_.path();
    options_.sandbox_mode = SandboxMode::WorkspaceWrite;
    options_.approval_policy = ApprovalPolicy::Never;
  }

  std::unique_ptr<AgentLoop> make_loop() {
    return std::make_unique<AgentLoop>(provider_, registry_, options_);
  }

  TempDir dir_;
  std::shared_ptr<ScriptedProvider> provider_;
  std::shared_ptr<ToolRegistry> registry_;
  LoopOptions options_;
};

TEST_F(AgentLoopTest, PlainAnswerTerminatesDone) {
  provider_->push(text_reply("All good."));

  auto loop = make_loop();
  auto result = loop->run("hello");

  EXPECT_EQ(result.reason, TerminationReason::Done);
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.final_answer, "All good.");
  EXPECT_EQ(result.steps, 0);
  ASSERT_EQ(result.transcript.size(), 2u);
  EXPECT_EQ(result.transcript[0].role(), Role::User);
  EXPECT_EQ(result.transcript[1].role(), Role::Assistant);
  EXPECT_EQ(loop->loop_state(), LoopState::Terminated);
  EXPECT_EQ(result.usage.input_tokens, 10);

  auto request = provider_->request(0);
  EXPECT_EQ(request.model, "test-model");
  EXPECT_EQ(request.system_prompt, "system");
}

TEST_F(AgentLoopTest, ToolResultsFollowEmissionOrder) {
  auto slow = std::make_shared<FakeTool>("slow", false);
  auto fast = std::make_shared<FakeTool>("fast", false);
  registry_->register_tool(slow);
  registry_->register_tool(fast);

  provider_->push(tool_reply({{"c1", "slow", {{"delay_ms", 400}}}, {"c2", "fast", json::object()}, {"c3", "slow", {{"delay_ms", 400}}}}));
  provider_->push(text_reply("done"));

  auto start = std::chrono::steady_clock::now();
  auto result = make_loop()->run("go");
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(result.reason, TerminationReason::Done);
  ASSERT_EQ(result.transcript.size(), 6u);
  EXPECT_EQ(result.transcript[2].tool_call_id(), "c1");
  EXPECT_EQ(result.transcript[3].tool_call_id(), "c2");
  EXPECT_EQ(result.transcript[4].tool_call_id(), "c3");
  EXPECT_EQ(result.transcript[3].tool_result()->output, "fast ok");
  EXPECT_EQ(result.steps, 1);
  // Calls of one batch overlap
  EXPECT_LT(elapsed, std::chrono::milliseconds(750));

  // Second request carries every result
  ASSERT_EQ(provider_->calls(), 2u);
  EXPECT_EQ(provider_->request(1).messages.size(), 5u);
}

TEST_F(AgentLoopTest, SequentialWhenParallelismIsOne) {
  std::vector<std::string> seen;
  std::mutex seen_mutex;
  auto recorder = [&](const json &args) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    seen.push_back(args.value("path", ""));
    return ToolResult::success("ok");
  };
  registry_->register_tool(std::make_shared<FakeTool>("record", false, recorder));
  options_.max_parallel_tools = 1;

  provider_->push(tool_reply({{"a", "record", {{"path", "1"}}}, {"b", "record", {{"path", "2"}}}, {"c", "record", {{"path", "3"}}}}));
  provider_->push(text_reply("done"));

  make_loop()->run("go");
  EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3"}));
}

TEST_F(AgentLoopTest, MaxStepsStopsBeforeNextModelCall) {
  registry_->register_tool(std::make_shared<FakeTool>("noop", false));
  options_.max_steps = 1;
  provider_->push(tool_reply({{"c1", "noop", json::object()}}));
  provider_->push(text_reply("never reached"));

  auto result = make_loop()->run("loop forever");

  EXPECT_EQ(result.reason, TerminationReason::MaxStepsExceeded);
  EXPECT_EQ(provider_->calls(), 1u);
  EXPECT_EQ(result.steps, 1);

  const auto &closing = result.transcript.back();
  EXPECT_EQ(closing.role(), Role::Assistant);
  EXPECT_TRUE(closing.is_synthetic());
  EXPECT_EQ(closing.finish_reason(), FinishReason::Length);
  EXPECT_NE(closing.text().find("step limit (1 steps)"), std::string::npos);
  EXPECT_EQ(result.final_answer, closing.text());
}

TEST_F(AgentLoopTest, DeclinedCallBecomesErrorResult) {
  auto writer = std::make_shared<FakeTool>("fake_write", true);
  registry_->register_tool(writer);
  options_.approval_policy = ApprovalPolicy::Always;
  options_.confirm = [](const std::string &, const json &) { return false; };

  provider_->push(tool_reply({{"w1", "fake_write", {{"path", "a.txt"}}}}));
  provider_->push(text_reply("Okay, I will not write."));

  auto result = make_loop()->run("write a file");

  EXPECT_EQ(result.reason, TerminationReason::Done);
  EXPECT_EQ(writer->invocations, 0);
  const auto *denied = result.transcript[2].tool_result();
  ASSERT_NE(denied, nullptr);
  EXPECT_TRUE(denied->is_error);
  EXPECT_EQ(denied->output, "Tool call fake_write denied by user");
  EXPECT_EQ(result.final_answer, "Okay, I will not write.");
}

TEST_F(AgentLoopTest, UnknownToolDoesNotStopTheLoop) {
  provider_->push(tool_reply({{"x1", "delete_everything", json::object()}}));
  provider_->push(text_reply("That tool does not exist."));

  auto result = make_loop()->run("clean up");
  EXPECT_EQ(result.reason, TerminationReason::Done);
  EXPECT_EQ(result.transcript[2].tool_result()->output, "Unknown tool: delete_everything");
}

TEST_F(AgentLoopTest, ProviderErrorKeepsPartialTranscript) {
  registry_->register_tool(std::make_shared<FakeTool>("noop", false));
  provider_->push(tool_reply({{"c1", "noop", json::object()}}));
  provider_->push_error(ProviderErrorKind::Auth, "HTTP 401: bad key");

  auto result = make_loop()->run("go");

  EXPECT_EQ(result.reason, TerminationReason::Error);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error.value_or(""), "HTTP 401: bad key");
  EXPECT_EQ(result.error_kind, ProviderErrorKind::Auth);
  EXPECT_EQ(result.transcript.size(), 3u);
}

TEST_F(AgentLoopTest, MissingProviderIsAnError) {
  AgentLoop loop(nullptr, registry_, options_);
  auto result = loop.run("hi");
  EXPECT_EQ(result.reason, TerminationReason::Error);
  EXPECT_TRUE(result.error.has_value());
}

TEST_F(AgentLoopTest, CancelDuringToolBatch) {
  auto slow = std::make_shared<FakeTool>("slow", false);
  registry_->register_tool(slow);
  provider_->push(tool_reply({{"c1", "slow", {{"delay_ms", 5000}}}}));
  provider_->push(text_reply("unreachable"));

  auto loop = make_loop();
  std::thread canceller([&loop]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    loop->cancel();
  });

  auto start = std::chrono::steady_clock::now();
  auto result = loop->run("go");
  canceller.join();

  EXPECT_EQ(result.reason, TerminationReason::Cancelled);
  EXPECT_EQ(provider_->calls(), 1u);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
  // The cancelled call still gets its result
  EXPECT_EQ(result.transcript.back().tool_result()->output, "Cancelled");
}

TEST_F(AgentLoopTest, ExternalAbortSignalCancels) {
  options_.abort_signal = std::make_shared<std::atomic<bool>>(true);
  provider_->push(text_reply("unused"));

  auto result = make_loop()->run("hi");
  EXPECT_EQ(result.reason, TerminationReason::Cancelled);
  EXPECT_EQ(provider_->calls(), 0u);
}

TEST_F(AgentLoopTest, PlanUpdatesLandInResult) {
  registry_->register_tool(std::make_shared<tools::UpdatePlanTool>());
  provider_->push(tool_reply({{"p1", "update_plan", {{"plan", {{{"step", "inspect"}, {"status", "in_progress"}}, {{"step", "patch"}, {"status", "pending"}}}}}}}));
  provider_->push(text_reply("planned"));

  auto loop = make_loop();
  auto result = loop->run("plan it");

  ASSERT_EQ(result.plan.size(), 2u);
  EXPECT_EQ(result.plan[0].step, "inspect");
  EXPECT_EQ(result.plan[1].status, "pending");
  EXPECT_EQ(loop->state().plan.size(), 2u);
}

TEST_F(AgentLoopTest, CallbacksAndBusEvents) {
  registry_->register_tool(std::make_shared<FakeTool>("noop", false));

  Message thinking(Role::Assistant, "");
  thinking.add_reasoning("let me look");
  thinking.add_tool_call("c1", "noop", json::object());
  thinking.set_finish_reason(FinishReason::ToolCalls);
  provider_->push(thinking);
  provider_->push(text_reply("done"));

  auto loop = make_loop();
  std::vector<std::string> trace;
  loop->on_reasoning([&](const std::string &text) { trace.push_back("reasoning:" + text); });
  loop->on_tool_call([&](const ToolCallPart &call) { trace.push_back("call:" + call.name); });
  loop->on_tool_result([&](const ToolCallPart &call, const ToolResult &result) { trace.push_back("result:" + call.id + ":" + result.output); });

  std::vector<std::string> ended;
  int tool_events = 0;
  ScopedSubscription on_end(Bus::instance().subscribe<events::SessionEnded>([&](const events::SessionEnded &e) {
    if (e.session_id == loop->id()) ended.push_back(e.reason);
  }));
  ScopedSubscription on_tool(Bus::instance().subscribe<events::ToolCallCompleted>([&](const events::ToolCallCompleted &e) {
    if (e.session_id == loop->id()) ++tool_events;
  }));

  loop->run("go");

  EXPECT_EQ(trace, (std::vector<std::string>{"reasoning:let me look", "call:noop", "result:c1:noop ok"}));
  EXPECT_EQ(ended, std::vector<std::string>{"done"});
  EXPECT_EQ(tool_events, 1);
}

TEST_F(AgentLoopTest, OptionsFromConfig) {
  Config config;
  config.model = "m";
  config.max_steps = 7;
  config.max_parallel_tools = 2;
  config.sandbox_mode = SandboxMode::ReadOnly;
  config.approval_policy = ApprovalPolicy::Always;

  auto options = LoopOptions::from_config(config);
  EXPECT_EQ(options.model, "m");
  EXPECT_EQ(options.max_steps, 7);
  EXPECT_EQ(options.max_parallel_tools, 2);
  EXPECT_EQ(options.sandbox_mode, SandboxMode::ReadOnly);
  EXPECT_EQ(options.approval_policy, ApprovalPolicy::Always);

  EXPECT_EQ(to_string(TerminationReason::MaxStepsExceeded), "max_steps_exceeded");
  EXPECT_EQ(to_string(LoopState::AwaitingToolResults), "awaiting_tool_results");
}
