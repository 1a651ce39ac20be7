#pragma once

#include <filesystem>
#include <string>

namespace codeloop {

// Built-in base prompt used when the configuration gives none
const std::string &default_base_prompt();

// Base text, working environment (UTC time, workspace root), then the
// AGENTS.md chain from the filesystem root down to workspace_root
std::string build_system_prompt(const std::filesystem::path &workspace_root, const std::string &base_prompt = "");

}  // namespace codeloop
