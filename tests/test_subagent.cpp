#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include "codeloop/codeloop.hpp"
#include "test_helpers.hpp"

using namespace codeloop;
using codeloop::test::FakeTool;
using codeloop::test::ScriptedProvider;
using codeloop::test::TempDir;
using codeloop::test::text_reply;
using codeloop::test::tool_reply;

namespace {

std::vector<std::string> tool_names(const llm::LlmRequest &request) {
  std::vector<std::string> names;
  for (const auto &tool : request.tools) {
    names.push_back(tool->name());
  }
  return names;
}

}  // namespace

class SubagentTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<ScriptedProvider>();
    tools::register_builtins(registry_);
    parent_options_.model = "parent-model";
    parent_options_.system_prompt = "PARENT PROMPT";
    parent_options_.workspace_root = dir_.path();
    parent_options_.sandbox_mode = SandboxMode::DangerFullAccess;
    parent_options_.approval_policy = ApprovalPolicy::Always;
  }

  TempDir dir_;
  std::shared_ptr<ScriptedProvider> provider_;
  ToolRegistry registry_;
  LoopOptions parent_options_;
};

TEST_F(SubagentTest, DefaultProfiles) {
  auto profiles = default_profiles();
  ASSERT_EQ(profiles.size(), 3u);
  EXPECT_EQ(profiles[0].name, "general");
  EXPECT_EQ(profiles[1].name, "reviewer");
  EXPECT_EQ(profiles[2].name, "researcher");
  for (const auto &profile : profiles) {
    EXPECT_EQ(profile.allowed_tool_names, (std::vector<std::string>{"list_files", "read_file", "grep_files"}));
    EXPECT_EQ(profile.max_steps, 8);
    EXPECT_FALSE(profile.sandbox_mode.has_value());
  }

  SubagentDelegator delegator(provider_, registry_, profiles, parent_options_);
  EXPECT_EQ(delegator.profile_names(), (std::vector<std::string>{"general", "researcher", "reviewer"}));
  EXPECT_EQ(delegator.sandbox_mode("reviewer"), SandboxMode::ReadOnly);
  ASSERT_NE(delegator.find("general"), nullptr);
  EXPECT_EQ(delegator.find("hacker"), nullptr);
}

TEST_F(SubagentTest, ReadOnlyProfileRejectsMutatingTool) {
  SubagentProfile reviewer{"reviewer", "review", "review code", {"read_file", "write_file"}, 8, std::nullopt};
  try {
    SubagentDelegator delegator(provider_, registry_, {reviewer}, parent_options_);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError &e) {
    EXPECT_STREQ(e.what(), "subagent profile 'reviewer' is read-only but allows mutating tool write_file");
  }
}

TEST_F(SubagentTest, WritableProfileMayUseMutatingTool) {
  SubagentProfile fixer{"fixer", "fix", "fix code", {"read_file", "write_file"}, 4, SandboxMode::WorkspaceWrite};
  SubagentDelegator delegator(provider_, registry_, {fixer}, parent_options_);
  EXPECT_EQ(delegator.sandbox_mode("fixer"), SandboxMode::WorkspaceWrite);
}

TEST_F(SubagentTest, CatalogErrors) {
  SubagentProfile nested{"nested", "", "", {"read_file", "delegate_task"}, 8, std::nullopt};
  EXPECT_THROW(SubagentDelegator(provider_, registry_, {nested}, parent_options_), ConfigError);

  SubagentProfile unknown{"unknown", "", "", {"read_file", "teleport"}, 8, std::nullopt};
  try {
    SubagentDelegator delegator(provider_, registry_, {unknown}, parent_options_);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError &e) {
    EXPECT_NE(std::string(e.what()).find("subagent profile 'unknown'"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("teleport"), std::string::npos);
  }

  auto duplicated = default_profiles();
  duplicated.push_back(duplicated.front());
  EXPECT_THROW(SubagentDelegator(provider_, registry_, duplicated, parent_options_), ConfigError);
}

TEST_F(SubagentTest, RunUsesProfilePromptAndRestrictions) {
  dir_.write("main.cpp", "int main() { return 0; }\n");
  SubagentDelegator delegator(provider_, registry_, default_profiles(), parent_options_);

  provider_->push(tool_reply({{"r1", "read_file", {{"path", "main.cpp"}}}}));
  provider_->push(text_reply("No bugs found."));

  auto result = delegator.run("reviewer", "review main.cpp", "focus on exit codes");

  ASSERT_EQ(result.reason, TerminationReason::Done);
  EXPECT_EQ(result.final_answer, "No bugs found.");

  auto request = provider_->request(0);
  EXPECT_EQ(request.model, "parent-model");
  EXPECT_EQ(request.system_prompt.rfind("PARENT PROMPT\n\n# Subagent profile: reviewer\nYou are a code reviewer subagent.", 0), 0u);
  EXPECT_EQ(tool_names(request), (std::vector<std::string>{"grep_files", "list_files", "read_file"}));
  EXPECT_EQ(request.messages[0].text(), "review main.cpp\n\n# Context from the parent agent\nfocus on exit codes");

  // read_file ran without a confirmation prompt
  EXPECT_FALSE(result.transcript[2].tool_result()->is_error);
}

TEST_F(SubagentTest, RunAsToolOutcomes) {
  SubagentProfile quick{"quick", "", "be quick", {"list_files"}, 1, std::nullopt};
  SubagentDelegator delegator(provider_, registry_, {quick}, parent_options_);

  auto unknown = delegator.run_as_tool("ghost", "x", "", nullptr);
  EXPECT_TRUE(unknown.is_error);
  EXPECT_EQ(unknown.output, "unknown subagent profile: ghost (available: quick)");

  provider_->push(tool_reply({{"l1", "list_files", json::object()}}, "Listing first."));
  auto limited = delegator.run_as_tool("quick", "explore", "", nullptr);
  EXPECT_FALSE(limited.is_error);
  EXPECT_EQ(limited.output, "Subagent quick stopped after 1 steps without finishing.\nLast progress:\nListing first.");

  provider_->push_error(ProviderErrorKind::Auth, "HTTP 401: bad key");
  auto failed = delegator.run_as_tool("quick", "explore", "", nullptr);
  EXPECT_TRUE(failed.is_error);
  EXPECT_EQ(failed.output, "subagent quick failed: HTTP 401: bad key");

  auto abort = std::make_shared<std::atomic<bool>>(true);
  auto cancelled = delegator.run_as_tool("quick", "explore", "", abort);
  EXPECT_EQ(cancelled.output, "Cancelled");

  provider_->push(text_reply("three files"));
  EXPECT_EQ(delegator.delegate("quick", "count files"), "three files");
}

class RuntimeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<ScriptedProvider>();
    config_.model = "runtime-model";
    config_.workspace_root = dir_.path();
    config_.approval_policy = ApprovalPolicy::Never;
  }

  TempDir dir_;
  std::shared_ptr<ScriptedProvider> provider_;
  Config config_;
};

TEST_F(RuntimeTest, RegistersToolsAndPrompt) {
  auto runtime = Runtime::create(config_, provider_);

  EXPECT_EQ(runtime->registry()->size(), 8u);
  EXPECT_TRUE(runtime->registry()->contains("delegate_task"));
  EXPECT_NE(runtime->system_prompt().find("Workspace root: " + dir_.path().string()), std::string::npos);
  EXPECT_EQ(runtime->delegator()->profile_names().size(), 3u);
}

TEST_F(RuntimeTest, RejectsBadSetup) {
  EXPECT_THROW(Runtime::create(config_, nullptr), ConfigError);

  auto missing = config_;
  missing.workspace_root = dir_.path() / "does-not-exist";
  EXPECT_THROW(Runtime::create(missing, provider_), ConfigError);

  auto nested = config_;
  nested.subagents = {SubagentProfile{"loop", "", "", {"delegate_task"}, 8, std::nullopt}};
  EXPECT_THROW(Runtime::create(nested, provider_), ConfigError);
}

TEST_F(RuntimeTest, DelegateTaskRunsSubagent) {
  auto runtime = Runtime::create(config_, provider_);

  provider_->push(tool_reply({{"d1", "delegate_task", {{"task", "find TODOs"}, {"profile", "researcher"}}}}));
  provider_->push(text_reply("There are no TODOs."));
  provider_->push(text_reply("The subagent found nothing to do."));

  auto result = runtime->run_task("audit the repo");

  ASSERT_EQ(result.reason, TerminationReason::Done) << result.error.value_or("");
  EXPECT_EQ(result.final_answer, "The subagent found nothing to do.");
  ASSERT_EQ(provider_->calls(), 3u);

  // Parent sees delegate_task, the subagent does not
  auto parent_tools = tool_names(provider_->request(0));
  EXPECT_NE(std::find(parent_tools.begin(), parent_tools.end(), "delegate_task"), parent_tools.end());
  auto sub_request = provider_->request(1);
  EXPECT_EQ(tool_names(sub_request), (std::vector<std::string>{"grep_files", "list_files", "read_file"}));
  EXPECT_NE(sub_request.system_prompt.find("# Subagent profile: researcher"), std::string::npos);

  const auto *delegated = result.transcript[2].tool_result();
  ASSERT_NE(delegated, nullptr);
  EXPECT_EQ(delegated->tool_name, "delegate_task");
  EXPECT_EQ(delegated->output, "There are no TODOs.");
}

TEST_F(RuntimeTest, ParallelDelegationsKeepEmissionOrder) {
  config_.max_parallel_tools = 3;
  auto runtime = Runtime::create(config_, provider_);

  provider_->push(tool_reply({{"d1", "delegate_task", {{"task", "slow scan"}}},
                              {"d2", "delegate_task", {{"task", "quick scan"}}},
                              {"d3", "delegate_task", {{"task", "broken scan"}}}}));

  // Subagents share the provider and pull these in any order; each answers its own task
  auto answer_own_task = [](const llm::LlmRequest &request) -> llm::LlmResponse {
    auto task = request.messages.front().text();
    if (task == "broken scan") {
      throw ProviderError(ProviderErrorKind::Auth, "key revoked");
    }
    if (task == "slow scan") {
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
    llm::LlmResponse response;
    response.message = text_reply("finished " + task);
    return response;
  };
  for (int i = 0; i < 3; ++i) {
    provider_->push_step(answer_own_task);
  }
  provider_->push(text_reply("summary"));

  auto result = runtime->run_task("scan three ways");

  ASSERT_EQ(result.reason, TerminationReason::Done) << result.error.value_or("");
  EXPECT_EQ(result.final_answer, "summary");
  ASSERT_EQ(provider_->calls(), 5u);

  // user, assistant, then one result per call in emission order
  ASSERT_EQ(result.transcript.size(), 6u);
  std::vector<std::string> ids;
  for (size_t i = 2; i < 5; ++i) {
    const auto *tool_result = result.transcript[i].tool_result();
    ASSERT_NE(tool_result, nullptr);
    ids.push_back(tool_result->tool_call_id);
  }
  EXPECT_EQ(ids, (std::vector<std::string>{"d1", "d2", "d3"}));

  // A failing sibling does not cancel the others
  const auto *slow = result.transcript[2].tool_result();
  EXPECT_FALSE(slow->is_error);
  EXPECT_EQ(slow->output, "finished slow scan");

  const auto *quick = result.transcript[3].tool_result();
  EXPECT_FALSE(quick->is_error);
  EXPECT_EQ(quick->output, "finished quick scan");

  const auto *broken = result.transcript[4].tool_result();
  EXPECT_TRUE(broken->is_error);
  EXPECT_EQ(broken->output.rfind("subagent general failed: ", 0), 0u);
  EXPECT_NE(broken->output.find("key revoked"), std::string::npos);
}
