#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <tuple>

#include "llm/provider.hpp"
#include "tool/tool.hpp"

namespace codeloop::test {

namespace fs = std::filesystem;

// Temporary directory removed on destruction
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = fs::temp_directory_path() / ("codeloop_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    fs::create_directories(path_);
    path_ = fs::canonical(path_);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const {
    return path_;
  }

  fs::path write(const std::string &rel, const std::string &content) const {
    auto file = path_ / rel;
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }

  std::string read(const std::string &rel) const {
    std::ifstream in(path_ / rel, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }

 private:
  fs::path path_;
};

// Assistant message helpers
inline Message text_reply(const std::string &text) {
  Message msg(Role::Assistant, text);
  return msg;
}

inline Message tool_reply(const std::vector<std::tuple<std::string, std::string, json>> &calls, const std::string &text = "") {
  Message msg(Role::Assistant, text);
  for (const auto &[id, name, args] : calls) {
    msg.add_tool_call(id, name, args);
  }
  msg.set_finish_reason(FinishReason::ToolCalls);
  return msg;
}

// Provider replaying a script of responses and recording every request
class ScriptedProvider : public llm::Provider {
 public:
  using Step = std::function<llm::LlmResponse(const llm::LlmRequest &)>;

  std::string name() const override {
    return "scripted";
  }

  void push(Message msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back([msg](const llm::LlmRequest &) {
      llm::LlmResponse response;
      response.message = msg;
      response.finish_reason = msg.finish_reason();
      response.usage.input_tokens = 10;
      response.usage.output_tokens = 5;
      return response;
    });
  }

  void push_step(Step step) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::move(step));
  }

  void push_error(ProviderErrorKind kind, const std::string &message) {
    push_step([kind, message](const llm::LlmRequest &) -> llm::LlmResponse { throw ProviderError(kind, message); });
  }

  llm::LlmResponse send(const llm::LlmRequest &request, const std::shared_ptr<std::atomic<bool>> &abort_signal) override {
    Step step;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      if (script_.empty()) {
        throw ProviderError(ProviderErrorKind::InvalidResponse, "script exhausted");
      }
      step = std::move(script_.front());
      script_.pop_front();
    }
    if (abort_signal && abort_signal->load()) {
      throw CancelledError();
    }
    return step(request);
  }

  size_t calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  llm::LlmRequest request(size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.at(i);
  }

 private:
  mutable std::mutex mutex_;
  std::deque<Step> script_;
  std::vector<llm::LlmRequest> requests_;
};

// Configurable tool counting its invocations
class FakeTool : public SimpleTool {
 public:
  FakeTool(std::string name, bool mutating, std::function<ToolResult(const json &)> handler = nullptr)
      : SimpleTool(std::move(name), "fake tool for tests"), mutating_(mutating), handler_(std::move(handler)) {}

  std::vector<ParameterSchema> parameters() const override {
    return {{"path", "string", "Target path.", false, std::nullopt, std::nullopt},
            {"delay_ms", "integer", "Sleep before answering.", false, std::nullopt, std::nullopt},
            {"destructive", "boolean", "Ask again under on-request.", false, std::nullopt, std::nullopt}};
  }

  bool mutating() const override {
    return mutating_;
  }

  std::vector<std::string> path_arguments() const override {
    return {"path"};
  }

  bool needs_confirmation(const json &args) const override {
    return args.value("destructive", false);
  }

  std::chrono::seconds timeout(const json &) const override {
    return timeout_;
  }

  void set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
  }

  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override {
    invocations++;
    return std::async(std::launch::async, [this, args, ctx]() {
      int delay = args.value("delay_ms", 0);
      auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay);
      while (std::chrono::steady_clock::now() < deadline) {
        if (ctx.aborted()) {
          aborted_seen++;
          return ToolResult::error("aborted");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      if (handler_) {
        return handler_(args);
      }
      return ToolResult::success(name_ + " ok");
    });
  }

  std::atomic<int> invocations{0};
  std::atomic<int> aborted_seen{0};

 private:
  bool mutating_;
  std::function<ToolResult(const json &)> handler_;
  std::chrono::seconds timeout_{5};
};

}  // namespace codeloop::test
