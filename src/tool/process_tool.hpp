#pragma once

#include "core/config.hpp"
#include "tool/registry.hpp"
#include "tool/tool.hpp"

namespace codeloop {

// Tool backed by an external process.
// Arguments go to stdin as one JSON document; stdout must carry the result,
// either as JSON or as plain text. Non-zero exit or empty output is an error.
class ProcessTool : public Tool {
 public:
  explicit ProcessTool(ExternalToolConfig config);

  std::string name() const override {
    return config_.name;
  }
  std::string description() const override {
    return config_.description;
  }
  json parameter_schema() const override {
    return config_.parameters;
  }
  bool mutating() const override {
    return config_.mutating;
  }
  std::chrono::seconds timeout(const json &) const override {
    return std::chrono::seconds(config_.timeout_sec + 5);
  }
  std::vector<std::string> path_arguments() const override;

  std::future<ToolResult> execute(const json &args, const ToolContext &ctx) override;

  static constexpr size_t MAX_OUTPUT_CHARS = 8000;

 private:
  ExternalToolConfig config_;
};

// Render a structured payload as tool output text
std::string render_payload(const json &payload);

// Register every configured external tool; collisions throw ConfigError
void register_external_tools(ToolRegistry &registry, const std::vector<ExternalToolConfig> &tools);

}  // namespace codeloop
