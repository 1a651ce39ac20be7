#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "tool/process.hpp"
#include "tool/process_tool.hpp"

using namespace codeloop;
using codeloop::test::TempDir;

namespace {

ExternalToolConfig shell_tool(const std::string &name, const std::string &script, int timeout_sec = 10) {
  ExternalToolConfig config;
  config.name = name;
  config.description = "test tool " + name;
  config.parameters = {{"type", "object"},
                       {"properties", {{"query", {{"type", "string"}}}, {"target", {{"type", "string"}, {"format", "path"}}}}},
                       {"additionalProperties", false}};
  config.argv = {"/bin/sh", "-c", script};
  config.timeout_sec = timeout_sec;
  return config;
}

ToolContext context_for(const TempDir &dir) {
  ToolContext ctx;
  ctx.workspace_root = dir.path();
  ctx.abort_signal = std::make_shared<std::atomic<bool>>(false);
  return ctx;
}

}  // namespace

TEST(RunProcessTest, CapturesStreamsAndExitCode) {
  ProcessOptions options;
  options.argv = {"/bin/sh", "-c", "cat; echo oops >&2; exit 4"};
  options.stdin_data = "from stdin";
  options.merge_stderr = false;

  auto proc = run_process(options);
  ASSERT_TRUE(proc.spawned()) << proc.error;
  EXPECT_EQ(proc.exit_code, 4);
  EXPECT_EQ(proc.out, "from stdin");
  EXPECT_EQ(proc.err, "oops\n");
  EXPECT_FALSE(proc.timed_out);
}

TEST(RunProcessTest, MissingExecutable) {
  ProcessOptions options;
  options.argv = {"/definitely/not/here"};
  auto proc = run_process(options);
  ASSERT_TRUE(proc.spawned());
  EXPECT_EQ(proc.exit_code, 127);
}

TEST(RunProcessTest, AbortKillsChild) {
  ProcessOptions options;
  options.argv = {"/bin/sh", "-c", "sleep 30"};
  options.abort_signal = std::make_shared<std::atomic<bool>>(false);
  auto signal = options.abort_signal;
  std::thread canceller([signal]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    signal->store(true);
  });

  auto start = std::chrono::steady_clock::now();
  auto proc = run_process(options);
  canceller.join();
  EXPECT_TRUE(proc.cancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ProcessToolTest, DescribesItselfFromConfig) {
  ProcessTool tool(shell_tool("lookup", "true"));
  EXPECT_EQ(tool.name(), "lookup");
  EXPECT_EQ(tool.description(), "test tool lookup");
  EXPECT_TRUE(tool.mutating());
  EXPECT_EQ(tool.parameter_schema()["properties"].size(), 2u);
  EXPECT_EQ(tool.path_arguments(), std::vector<std::string>{"target"});
  EXPECT_TRUE(tool.validate_args({{"query", "x"}}).ok());
  EXPECT_TRUE(tool.validate_args({{"other", "x"}}).failed());
}

TEST(ProcessToolTest, ReceivesArgumentsAndReturnsJson) {
  TempDir dir;
  ProcessTool tool(shell_tool("echo_args", "cat"));

  auto result = tool.execute({{"query", "hello"}}, context_for(dir)).get();
  EXPECT_FALSE(result.is_error) << result.output;
  EXPECT_EQ(json::parse(result.output), (json{{"query", "hello"}}));
}

TEST(ProcessToolTest, StructuredPayloads) {
  TempDir dir;

  ProcessTool structured(shell_tool("structured", R"(echo '{"matches": [1, 2]}')"));
  auto rendered = structured.execute(json::object(), context_for(dir)).get();
  EXPECT_FALSE(rendered.is_error);
  EXPECT_EQ(json::parse(rendered.output), (json{{"matches", {1, 2}}}));

  ProcessTool flagged(shell_tool("flagged", R"(echo '{"output": "quota exceeded", "is_error": true}')"));
  auto error = flagged.execute(json::object(), context_for(dir)).get();
  EXPECT_TRUE(error.is_error);
  EXPECT_EQ(error.output, "quota exceeded");

  ProcessTool plain(shell_tool("plain", "echo just text"));
  EXPECT_EQ(plain.execute(json::object(), context_for(dir)).get().output, "just text");
}

TEST(ProcessToolTest, FailureModes) {
  TempDir dir;

  ProcessTool failing(shell_tool("failing", "echo partial; echo broken >&2; exit 2"));
  auto failed = failing.execute(json::object(), context_for(dir)).get();
  EXPECT_TRUE(failed.is_error);
  EXPECT_EQ(failed.output, "failing exited with code 2\nbroken\n");
  EXPECT_EQ(failed.metadata["exit_code"], 2);

  ProcessTool silent(shell_tool("silent", "true"));
  auto empty = silent.execute(json::object(), context_for(dir)).get();
  EXPECT_TRUE(empty.is_error);
  EXPECT_EQ(empty.output, "silent produced no output");

  ProcessTool malformed(shell_tool("malformed", R"(echo '{"unterminated": ')"));
  auto bad = malformed.execute(json::object(), context_for(dir)).get();
  EXPECT_TRUE(bad.is_error);
  EXPECT_EQ(bad.output, "malformed returned malformed JSON");
}

TEST(ProcessToolTest, TimesOut) {
  TempDir dir;
  ProcessTool slow(shell_tool("slow", "sleep 30", 1));
  auto result = slow.execute(json::object(), context_for(dir)).get();
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.metadata["error_kind"], "timeout");
  EXPECT_EQ(result.output, "slow timed out after 1s");
}

TEST(ProcessToolTest, RunsInWorkspace) {
  TempDir dir;
  dir.write("marker.txt", "");
  ProcessTool tool(shell_tool("where", "ls"));
  EXPECT_EQ(tool.execute(json::object(), context_for(dir)).get().output, "marker.txt");
}

TEST(ProcessToolTest, RegisterExternalTools) {
  ToolRegistry registry;
  register_external_tools(registry, {shell_tool("ext_a", "true"), shell_tool("ext_b", "true")});
  EXPECT_TRUE(registry.contains("ext_a"));
  EXPECT_TRUE(registry.contains("ext_b"));

  ExternalToolConfig empty;
  empty.name = "empty";
  EXPECT_THROW(register_external_tools(registry, {empty}), ConfigError);
  EXPECT_THROW(register_external_tools(registry, {shell_tool("ext_a", "true")}), ConfigError);
}
