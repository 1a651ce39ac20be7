#include "tool/process_tool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "tool/process.hpp"

namespace codeloop {

ProcessTool::ProcessTool(ExternalToolConfig config) : config_(std::move(config)) {
  config_.timeout_sec = std::clamp(config_.timeout_sec, 1, 1800);
  if (!config_.parameters.is_object()) {
    config_.parameters = json{{"type", "object"}, {"properties", json::object()}};
  }
}

std::vector<std::string> ProcessTool::path_arguments() const {
  // Properties declared with "format": "path" hold filesystem paths
  std::vector<std::string> result;
  auto it = config_.parameters.find("properties");
  if (it != config_.parameters.end() && it->is_object()) {
    for (auto prop = it->begin(); prop != it->end(); ++prop) {
      if (prop->is_object() && prop->value("format", "") == "path") {
        result.push_back(prop.key());
      }
    }
  }
  return result;
}

std::string render_payload(const json &payload) {
  if (payload.is_string()) {
    return payload.get<std::string>();
  }
  if (payload.is_object()) {
    // {"output": "..."} / {"content": "..."} carry plain text
    for (const char *key : {"output", "content", "text", "result"}) {
      auto it = payload.find(key);
      if (it != payload.end() && it->is_string() && payload.size() <= 2) {
        return it->get<std::string>();
      }
    }
  }
  return payload.dump(2);
}

std::future<ToolResult> ProcessTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [this, args, ctx]() -> ToolResult {
    ProcessOptions options;
    options.argv = config_.argv;
    options.stdin_data = args.dump();
    options.timeout = std::chrono::seconds(config_.timeout_sec);
    options.merge_stderr = false;
    options.abort_signal = ctx.abort_signal;
    if (config_.workdir) {
      options.workdir = paths::resolve(ctx.workspace_root, config_.workdir->string());
    } else {
      options.workdir = ctx.workspace_root;
    }

    spdlog::debug("[ProcessTool] {} -> {}", config_.name, config_.argv.front());
    auto proc = run_process(options);

    if (!proc.spawned()) {
      return ToolResult::error(config_.name + ": " + proc.error);
    }
    if (proc.cancelled) {
      return ToolResult::error("Cancelled");
    }
    if (proc.timed_out) {
      return ToolResult::error(config_.name + " timed out after " + std::to_string(config_.timeout_sec) + "s", ToolErrorKind::Timeout);
    }

    std::string stdout_text = proc.out;
    stdout_text.erase(0, stdout_text.find_first_not_of(" \t\r\n"));
    stdout_text.erase(stdout_text.find_last_not_of(" \t\r\n") + 1);

    if (proc.exit_code != 0) {
      std::string detail = proc.err.empty() ? stdout_text : proc.err;
      auto result = ToolResult::error(config_.name + " exited with code " + std::to_string(proc.exit_code) + "\n" +
                                      Truncate::chars(detail, MAX_OUTPUT_CHARS));
      result.metadata["exit_code"] = proc.exit_code;
      return result;
    }

    if (stdout_text.empty()) {
      return ToolResult::error(config_.name + " produced no output");
    }

    // Structured payload when it parses, the text itself otherwise
    std::string output = stdout_text;
    bool is_error = false;
    try {
      auto payload = json::parse(stdout_text);
      if (payload.is_object() && payload.value("is_error", false)) {
        is_error = true;
      }
      output = render_payload(payload);
    } catch (const json::parse_error &) {
      if (stdout_text.front() == '{' || stdout_text.front() == '[') {
        return ToolResult::error(config_.name + " returned malformed JSON");
      }
    }

    ToolResult result = ToolResult::success(Truncate::chars(output, MAX_OUTPUT_CHARS));
    result.is_error = is_error;
    return result;
  });
}

void register_external_tools(ToolRegistry &registry, const std::vector<ExternalToolConfig> &tools) {
  for (const auto &config : tools) {
    if (config.argv.empty()) {
      throw ConfigError("external tool '" + config.name + "' has an empty argv");
    }
    registry.register_tool(std::make_shared<ProcessTool>(config));
  }
}

}  // namespace codeloop
