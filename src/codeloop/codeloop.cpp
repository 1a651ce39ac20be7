#include "codeloop/codeloop.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "log/log.h"

namespace codeloop {

void init(const Config &config) {
  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);
  spdlog::info("codeloop {} starting, provider={} model={}", version(), config.provider, config.model);
}

std::string version() {
  return CODELOOP_VERSION_STRING;
}

std::shared_ptr<Runtime> Runtime::create(const Config &config, asio::io_context &io_ctx) {
  auto provider_config = config.get_provider(config.provider).value_or(ProviderConfig{});
  if (provider_config.name.empty()) {
    provider_config.name = config.provider;
  }

  llm::RetryPolicy retry;
  retry.max_retries = config.max_retries;
  retry.backoff = std::chrono::milliseconds(config.retry_backoff_ms);
  retry.timeout = std::chrono::seconds(config.timeout_sec);

  auto provider = llm::ProviderFactory::instance().create(config.provider, provider_config, io_ctx, retry);
  return create(config, std::move(provider));
}

std::shared_ptr<Runtime> Runtime::create(const Config &config, std::shared_ptr<llm::Provider> provider) {
  if (!provider) {
    throw ConfigError("no model provider for " + config.provider);
  }
  return std::shared_ptr<Runtime>(new Runtime(config, std::move(provider)));
}

Runtime::Runtime(Config config, std::shared_ptr<llm::Provider> provider)
    : config_(std::move(config)), provider_(std::move(provider)), registry_(std::make_shared<ToolRegistry>()) {
  std::error_code ec;
  auto root = std::filesystem::weakly_canonical(std::filesystem::absolute(config_.workspace_root), ec);
  if (!ec) {
    config_.workspace_root = root;
  }
  if (!std::filesystem::is_directory(config_.workspace_root)) {
    throw ConfigError("workspace root is not a directory: " + config_.workspace_root.string());
  }

  tools::register_builtins(*registry_);
  register_external_tools(*registry_, config_.external_tools);

  system_prompt_ = build_system_prompt(config_.workspace_root, config_.system_prompt);

  auto options = LoopOptions::from_config(config_);
  options.system_prompt = system_prompt_;

  // Bound against the registry before delegate_task exists
  auto profiles = config_.subagents.empty() ? default_profiles() : config_.subagents;
  delegator_ = std::make_shared<SubagentDelegator>(provider_, *registry_, profiles, options);

  auto delegator = delegator_;
  registry_->register_tool(std::make_shared<tools::DelegateTaskTool>(
      [delegator](const std::string &profile, const std::string &task, const std::string &context,
                  const std::shared_ptr<std::atomic<bool>> &abort_signal) { return delegator->run_as_tool(profile, task, context, abort_signal); },
      delegator_->profile_names()));

  spdlog::info("[Runtime] {} tool(s), {} subagent profile(s), sandbox={} approval={}", registry_->size(), delegator_->profile_names().size(),
               to_string(config_.sandbox_mode), to_string(config_.approval_policy));
}

std::unique_ptr<AgentLoop> Runtime::new_loop(ConfirmFn confirm) const {
  auto options = LoopOptions::from_config(config_);
  options.system_prompt = system_prompt_;
  options.confirm = std::move(confirm);
  return std::make_unique<AgentLoop>(provider_, registry_, std::move(options));
}

RunResult Runtime::run_task(const std::string &task, ConfirmFn confirm) const {
  auto loop = new_loop(std::move(confirm));
  return loop->run(task);
}

}  // namespace codeloop
