#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tool/tool.hpp"

namespace codeloop {

// Name-keyed tool catalog, populated at startup and read-only afterwards
class ToolRegistry {
 public:
  ToolRegistry() = default;

  // Throws ConfigError when the name is already taken
  void register_tool(std::shared_ptr<Tool> tool);

  std::shared_ptr<Tool> get(const std::string &name) const;

  bool contains(const std::string &name) const;

  // Sorted by name
  std::vector<std::shared_ptr<Tool>> all() const;

  std::vector<std::string> names() const;

  size_t size() const;

  // Registry holding only the listed tools.
  // Throws ConfigError naming the first tool this registry does not have.
  std::shared_ptr<ToolRegistry> view(const std::vector<std::string> &allowed_names) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace codeloop
