#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "codeloop/codeloop.hpp"

using namespace codeloop;

static bool confirm_on_terminal(const std::string &tool, const json &args) {
  std::cout << "\n[Approval requested: " << tool << "]\n" << args.dump(2) << "\nAllow? (y/n): " << std::flush;
  std::string input;
  if (!std::getline(std::cin, input)) return false;
  return input == "y" || input == "Y" || input == "yes";
}

int main(int argc, char *argv[]) {
  std::string task;
  for (int i = 1; i < argc; ++i) {
    if (!task.empty()) task += " ";
    task += argv[i];
  }
  if (task.empty()) {
    std::cerr << "usage: " << argv[0] << " <task text>\n";
    return 2;
  }

  Config config;
  try {
    config = Config::from_env();
  } catch (const ConfigError &e) {
    std::cerr << "config error: " << e.what() << "\n";
    return 2;
  }
  init(config);

  asio::io_context io_ctx;
  auto work_guard = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() { io_ctx.run(); });

  int exit_code = 0;
  try {
    auto runtime = Runtime::create(config, io_ctx);
    std::shared_ptr<AgentLoop> loop = runtime->new_loop(confirm_on_terminal);

    loop->on_reasoning([](const std::string &text) { std::cout << "[thinking] " << text << "\n"; });
    loop->on_tool_call([](const ToolCallPart &call) { std::cout << "[tool] " << call.name << " " << call.arguments.dump() << "\n"; });
    loop->on_tool_result([](const ToolCallPart &call, const ToolResult &result) {
      std::cout << "[tool " << call.name << " " << (result.is_error ? "failed" : "completed") << "]\n";
      if (result.output.size() > 500) {
        std::cout << result.output.substr(0, 500) << "... (" << result.output.size() << " chars total)\n";
      } else {
        std::cout << result.output << "\n";
      }
    });

    // SIGINT is delivered on the io thread, outside signal context
    asio::signal_set signals(io_ctx, SIGINT);
    signals.async_wait([weak = std::weak_ptr<AgentLoop>(loop)](const asio::error_code &ec, int) {
      if (ec) return;
      if (auto target = weak.lock()) {
        std::cout << "\n[Interrupted]\n" << std::flush;
        target->cancel();
      }
    });

    auto result = loop->run(task);
    signals.cancel();

    std::cout << "\n" << result.final_answer << "\n";
    if (!result.ok()) {
      std::cerr << "[terminated: " << to_string(result.reason);
      if (result.error) std::cerr << ": " << *result.error;
      std::cerr << "]\n";
      exit_code = 1;
    }
    std::cerr << "[steps: " << result.steps << ", tokens: " << result.usage.total() << "]\n";
  } catch (const ConfigError &e) {
    std::cerr << "config error: " << e.what() << "\n";
    exit_code = 2;
  }

  work_guard.reset();
  io_ctx.stop();
  io_thread.join();
  return exit_code;
}
