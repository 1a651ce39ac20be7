#include "tool/registry.hpp"

#include <spdlog/spdlog.h>

namespace codeloop {

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) {
    throw ConfigError("cannot register a null tool");
  }
  auto name = tool->name();
  std::lock_guard lock(mutex_);
  if (tools_.count(name)) {
    throw ConfigError("duplicate tool name: " + name);
  }
  spdlog::debug("[ToolRegistry] Registered {} (mutating={})", name, tool->mutating());
  tools_[name] = std::move(tool);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &name) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(name);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

bool ToolRegistry::contains(const std::string &name) const {
  std::lock_guard lock(mutex_);
  return tools_.count(name) > 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto &[name, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

std::vector<std::string> ToolRegistry::names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> result;
  result.reserve(tools_.size());
  for (const auto &[name, tool] : tools_) {
    result.push_back(name);
  }
  return result;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return tools_.size();
}

std::shared_ptr<ToolRegistry> ToolRegistry::view(const std::vector<std::string> &allowed_names) const {
  auto restricted = std::make_shared<ToolRegistry>();
  for (const auto &name : allowed_names) {
    auto tool = get(name);
    if (!tool) {
      throw ConfigError("unknown tool in allowed list: " + name);
    }
    if (!restricted->contains(name)) {
      restricted->register_tool(tool);
    }
  }
  return restricted;
}

}  // namespace codeloop
