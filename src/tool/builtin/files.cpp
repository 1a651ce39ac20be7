#include <fnmatch.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

#include "builtins.hpp"

namespace codeloop::tools {

namespace fs = std::filesystem;

namespace {

constexpr int kDefaultLimit = 200;
constexpr int kMaxLimit = 2000;

int clamp_limit(const json &args, const char *key, int fallback = kDefaultLimit) {
  return clamp_int_arg(args, key, fallback, 1, kMaxLimit);
}

// Workspace-relative when possible, absolute otherwise
std::string display_path(const ToolContext &ctx, const fs::path &path) {
  auto root = paths::resolve(ctx.workspace_root, ".");
  if (paths::is_within(root, path)) {
    auto rel = path.lexically_relative(root);
    return rel.empty() ? "." : rel.generic_string();
  }
  return path.string();
}

std::optional<std::string> read_text(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return std::nullopt;
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::string line;
  std::istringstream stream(text);
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  return lines;
}

// "*.{ts,tsx}" -> {"*.ts", "*.tsx"}
std::vector<std::string> expand_braces(const std::string &pattern) {
  auto open = pattern.find('{');
  auto close = open == std::string::npos ? std::string::npos : pattern.find('}', open);
  if (close == std::string::npos) return {pattern};

  std::vector<std::string> result;
  std::string prefix = pattern.substr(0, open);
  std::string suffix = pattern.substr(close + 1);
  std::stringstream alternatives(pattern.substr(open + 1, close - open - 1));
  std::string alt;
  while (std::getline(alternatives, alt, ',')) {
    for (auto &expanded : expand_braces(prefix + alt + suffix)) {
      result.push_back(std::move(expanded));
    }
  }
  return result;
}

bool glob_matches(const std::vector<std::string> &globs, const fs::path &rel) {
  if (globs.empty()) return true;
  auto rel_str = rel.generic_string();
  auto name = rel.filename().string();
  for (const auto &g : globs) {
    // Patterns with a slash match the relative path, others the file name
    const std::string &subject = g.find('/') != std::string::npos ? rel_str : name;
    if (fnmatch(g.c_str(), subject.c_str(), 0) == 0) return true;
  }
  return false;
}

bool looks_binary(const std::string &content) {
  return content.find('\0', 0) < std::min<size_t>(content.size(), 8000);
}

}  // namespace

// ============================================================================
// ListFilesTool
// ============================================================================

ListFilesTool::ListFilesTool()
    : SimpleTool("list_files",
                 "List files and directories under a given path. One entry per line; directories have a trailing slash. "
                 "Lists recursively up to 200 entries by default. Use recursive=false for a shallow listing.") {}

std::vector<ParameterSchema> ListFilesTool::parameters() const {
  return {{"path", "string", "Relative or absolute path to list. Defaults to the workspace root ('.').", false, json("."), std::nullopt},
          {"recursive", "boolean", "List recursively (default true).", false, json(true), std::nullopt},
          {"max_entries", "integer", "Maximum entries to return. Defaults to 200. Range: 1-2000.", false, json(kDefaultLimit), std::nullopt}};
}

std::future<ToolResult> ListFilesTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string raw = args.value("path", ".");
    bool recursive = args.value("recursive", true);
    int max_entries = clamp_limit(args, "max_entries");

    auto resolved = ctx.resolve_path(raw);
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }
    const auto &root = *resolved.value;

    std::error_code ec;
    if (!fs::exists(root, ec)) {
      return ToolResult::error("path does not exist: " + root.string());
    }
    if (fs::is_regular_file(root, ec)) {
      return ToolResult::success(display_path(ctx, root));
    }

    std::vector<fs::path> items;
    auto options = fs::directory_options::skip_permission_denied;
    if (recursive) {
      for (auto it = fs::recursive_directory_iterator(root, options, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        items.push_back(it->path());
      }
    } else {
      for (auto it = fs::directory_iterator(root, options, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        items.push_back(it->path());
      }
    }
    if (ec) {
      spdlog::warn("[ListFiles] Iteration of {} stopped: {}", root.string(), ec.message());
    }
    std::sort(items.begin(), items.end());

    std::string output;
    int count = 0;
    for (const auto &item : items) {
      if (!output.empty()) output += "\n";
      output += display_path(ctx, item);
      if (fs::is_directory(item, ec)) output += "/";
      if (++count >= max_entries) {
        if (items.size() > static_cast<size_t>(max_entries)) {
          output += "\n... truncated at " + std::to_string(max_entries) + " entries";
        }
        break;
      }
    }

    return ToolResult::success(output.empty() ? "(empty directory)" : sanitize_utf8(output));
  });
}

// ============================================================================
// ReadFileTool
// ============================================================================

ReadFileTool::ReadFileTool()
    : SimpleTool("read_file",
                 "Read a file with line numbers (6-wide line number, a tab, then the line). "
                 "Reads up to 200 lines from line 1 by default; use start_line and num_lines for other sections.") {}

std::vector<ParameterSchema> ReadFileTool::parameters() const {
  return {{"path", "string", "Relative or absolute path to the file to read.", true, std::nullopt, std::nullopt},
          {"start_line", "integer", "1-based first line. Defaults to 1.", false, json(1), std::nullopt},
          {"num_lines", "integer", "Number of lines to read. Defaults to 200. Maximum: 2000.", false, json(kDefaultLimit), std::nullopt}};
}

std::future<ToolResult> ReadFileTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string raw = args.value("path", "");
    int start_line = clamp_int_arg(args, "start_line", 1, 1, std::numeric_limits<int>::max());
    int num_lines = clamp_limit(args, "num_lines");

    auto resolved = ctx.resolve_path(raw);
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }
    const auto &path = *resolved.value;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      return ToolResult::error("file not found: " + path.string());
    }

    auto content = read_text(path);
    if (!content) {
      return ToolResult::error("cannot read file: " + path.string());
    }

    auto lines = split_lines(*content);
    size_t first = static_cast<size_t>(start_line - 1);
    if (first >= lines.size()) {
      return ToolResult::success("(no content)");
    }
    size_t last = std::min(lines.size(), first + static_cast<size_t>(num_lines));

    std::ostringstream out;
    for (size_t i = first; i < last; ++i) {
      if (i != first) out << "\n";
      out << std::setw(6) << (i + 1) << "\t" << lines[i];
    }
    return ToolResult::success(sanitize_utf8(out.str()));
  });
}

// ============================================================================
// GrepFilesTool
// ============================================================================

GrepFilesTool::GrepFilesTool()
    : SimpleTool("grep_files",
                 "Search file contents with a regular expression (ECMAScript syntax). "
                 "Output format is file:line_number:matching_line. Use glob to restrict files (e.g. '*.cpp', '*.{h,hpp}').") {}

std::vector<ParameterSchema> GrepFilesTool::parameters() const {
  return {{"pattern", "string", "Regex pattern to search for.", true, std::nullopt, std::nullopt},
          {"path", "string", "Directory or file to search. Defaults to the workspace root ('.').", false, json("."), std::nullopt},
          {"glob", "string", "Glob filter for file names (e.g. '*.py', 'src/**/*.rs').", false, std::nullopt, std::nullopt},
          {"max_results", "integer", "Maximum matching lines. Defaults to 200. Range: 1-2000.", false, json(kDefaultLimit), std::nullopt}};
}

std::future<ToolResult> GrepFilesTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string pattern = args.value("pattern", "");
    std::string raw = args.value("path", ".");
    int max_results = clamp_limit(args, "max_results");
    std::vector<std::string> globs;
    if (args.contains("glob") && args["glob"].is_string()) {
      globs = expand_braces(args["glob"].get<std::string>());
    }

    std::regex re;
    try {
      re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error &e) {
      return ToolResult::error("invalid pattern: " + std::string(e.what()));
    }

    auto resolved = ctx.resolve_path(raw);
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }
    const auto &root = *resolved.value;

    std::error_code ec;
    std::vector<fs::path> files;
    if (fs::is_regular_file(root, ec)) {
      files.push_back(root);
    } else if (fs::is_directory(root, ec)) {
      auto options = fs::directory_options::skip_permission_denied;
      for (auto it = fs::recursive_directory_iterator(root, options, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && it->path().filename() == ".git") {
          it.disable_recursion_pending();
          continue;
        }
        if (it->is_regular_file(ec) && glob_matches(globs, it->path().lexically_relative(root))) {
          files.push_back(it->path());
        }
      }
    } else {
      return ToolResult::error("path does not exist: " + root.string());
    }
    std::sort(files.begin(), files.end());

    std::vector<std::string> matches;
    for (const auto &file : files) {
      if (ctx.aborted()) {
        return ToolResult::error("Cancelled");
      }
      auto content = read_text(file);
      if (!content || looks_binary(*content)) continue;

      auto lines = split_lines(*content);
      for (size_t i = 0; i < lines.size(); ++i) {
        if (std::regex_search(lines[i], re)) {
          matches.push_back(display_path(ctx, file) + ":" + std::to_string(i + 1) + ":" + lines[i]);
          if (matches.size() >= static_cast<size_t>(max_results)) break;
        }
      }
      if (matches.size() >= static_cast<size_t>(max_results)) break;
    }

    if (matches.empty()) {
      return ToolResult::success("(no matches)");
    }
    std::string output;
    for (const auto &m : matches) {
      if (!output.empty()) output += "\n";
      output += m;
    }
    return ToolResult::success(sanitize_utf8(output));
  });
}

// ============================================================================
// WriteFileTool
// ============================================================================

WriteFileTool::WriteFileTool()
    : SimpleTool("write_file",
                 "Write content to a file, creating parent directories as needed. MUTATING. "
                 "mode=overwrite (default) replaces the file, mode=append adds to its end. "
                 "Prefer replace_in_file for targeted edits.") {}

std::vector<ParameterSchema> WriteFileTool::parameters() const {
  return {{"path", "string", "Relative or absolute path of the file to write.", true, std::nullopt, std::nullopt},
          {"content", "string", "Full text content to write.", true, std::nullopt, std::nullopt},
          {"mode", "string", "Write mode.", false, json("overwrite"), std::vector<std::string>{"overwrite", "append"}}};
}

std::future<ToolResult> WriteFileTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string raw = args.value("path", "");
    std::string content = args.value("content", "");
    std::string mode = args.value("mode", "overwrite");

    auto resolved = ctx.resolve_path(raw);
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }
    const auto &path = *resolved.value;

    std::error_code ec;
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), ec);
      if (ec) {
        return ToolResult::error("cannot create directory " + path.parent_path().string() + ": " + ec.message());
      }
    }

    auto flags = std::ios::binary | (mode == "append" ? std::ios::app : std::ios::trunc);
    std::ofstream file(path, flags);
    if (!file) {
      return ToolResult::error("cannot open file for writing: " + path.string());
    }
    file << content;
    file.close();
    if (!file) {
      return ToolResult::error("write failed: " + path.string());
    }

    spdlog::debug("[WriteFile] {} bytes to {} ({})", content.size(), path.string(), mode);
    return ToolResult::with_title("wrote " + std::to_string(content.size()) + " bytes to " + display_path(ctx, path) + " (" + mode + ")",
                                  "Wrote " + display_path(ctx, path));
  });
}

// ============================================================================
// ReplaceInFileTool
// ============================================================================

ReplaceInFileTool::ReplaceInFileTool()
    : SimpleTool("replace_in_file",
                 "Replace exact text in an existing file. MUTATING. Read the file first; old must match exactly, "
                 "including whitespace. Replaces up to count occurrences (default 1).") {}

std::vector<ParameterSchema> ReplaceInFileTool::parameters() const {
  return {{"path", "string", "Relative or absolute path of the file to edit.", true, std::nullopt, std::nullopt},
          {"old", "string", "Exact text to find.", true, std::nullopt, std::nullopt},
          {"new", "string", "Replacement text, may be empty.", true, std::nullopt, std::nullopt},
          {"count", "integer", "Maximum occurrences to replace. Defaults to 1.", false, json(1), std::nullopt}};
}

std::future<ToolResult> ReplaceInFileTool::execute(const json &args, const ToolContext &ctx) {
  return std::async(std::launch::async, [args, ctx]() -> ToolResult {
    std::string raw = args.value("path", "");
    std::string old_text = args.value("old", "");
    std::string new_text = args.value("new", "");
    int count = clamp_int_arg(args, "count", 1, 1, std::numeric_limits<int>::max());

    if (old_text.empty()) {
      return ToolResult::error("old must not be empty");
    }

    auto resolved = ctx.resolve_path(raw);
    if (!resolved.ok()) {
      return ToolResult::error(*resolved.error);
    }
    const auto &path = *resolved.value;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      return ToolResult::error("file not found: " + path.string());
    }
    auto content = read_text(path);
    if (!content) {
      return ToolResult::error("cannot read file: " + path.string());
    }

    int replaced = 0;
    size_t pos = 0;
    while (replaced < count && (pos = content->find(old_text, pos)) != std::string::npos) {
      content->replace(pos, old_text.size(), new_text);
      pos += new_text.size();
      ++replaced;
    }

    if (replaced == 0) {
      return ToolResult::error("no replacements made");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
      return ToolResult::error("cannot open file for writing: " + path.string());
    }
    file << *content;

    return ToolResult::with_title(
        "applied " + std::to_string(replaced) + " replacement" + (replaced == 1 ? "" : "s") + " in " + display_path(ctx, path),
        "Edited " + display_path(ctx, path));
  });
}

}  // namespace codeloop::tools
