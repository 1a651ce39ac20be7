#include "tool/tool.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

#include "tool/schema.hpp"

namespace codeloop {

namespace fs = std::filesystem;

json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  if (items) {
    schema["items"] = *items;
  }

  return schema;
}

json Tool::parameter_schema() const {
  json properties = json::object();
  json required_props = json::array();

  for (const auto &param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  return {{"type", "object"}, {"properties", properties}, {"required", required_props}, {"additionalProperties", false}};
}

json Tool::to_json_schema() const {
  return {{"name", name()}, {"description", description()}, {"parameters", parameter_schema()}};
}

Result<json> Tool::validate_args(const json &args) const {
  if (auto error = schema::validate(parameter_schema(), args)) {
    return Result<json>::failure(*error);
  }
  return Result<json>::success(args);
}

SimpleTool::SimpleTool(std::string name, std::string description) : name_(std::move(name)), description_(std::move(description)) {}

Result<fs::path> ToolContext::resolve_path(const std::string &raw) const {
  auto root = paths::resolve(workspace_root, ".");
  auto resolved = paths::resolve(root, raw);
  if (sandbox_mode != SandboxMode::DangerFullAccess && !paths::is_within(root, resolved)) {
    return Result<fs::path>::failure("path escapes workspace: " + raw);
  }
  return Result<fs::path>::success(resolved);
}

namespace paths {

fs::path resolve(const fs::path &root, const std::string &raw) {
  fs::path candidate(raw.empty() ? "." : raw);

  if (raw == "~" || raw.rfind("~/", 0) == 0) {
    const char *home = std::getenv("HOME");
    if (home) {
      candidate = fs::path(home) / raw.substr(raw.size() > 1 ? 2 : 1);
    }
  }

  if (candidate.is_relative()) {
    candidate = root / candidate;
  }

  std::error_code ec;
  auto resolved = fs::weakly_canonical(candidate, ec);
  if (ec) {
    return candidate.lexically_normal();
  }
  return resolved.lexically_normal();
}

bool is_within(const fs::path &root, const fs::path &target) {
  auto rel = target.lexically_relative(root);
  if (rel.empty()) return false;
  return *rel.begin() != "..";
}

}  // namespace paths

int clamp_int_arg(const json &args, const std::string &key, int fallback, int lo, int hi) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_number()) {
    return std::clamp(fallback, lo, hi);
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<uint64_t>();
    return value > static_cast<uint64_t>(hi) ? hi : std::max(lo, static_cast<int>(value));
  }
  if (it->is_number_float()) {
    return static_cast<int>(std::clamp(it->get<double>(), static_cast<double>(lo), static_cast<double>(hi)));
  }
  return static_cast<int>(std::clamp<int64_t>(it->get<int64_t>(), lo, hi));
}

namespace Truncate {

std::string chars(const std::string &text, size_t max_chars) {
  if (text.size() <= max_chars) {
    return sanitize_utf8(text);
  }

  // Step back over continuation bytes
  size_t cut = max_chars;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return sanitize_utf8(text.substr(0, cut)) + "\n... (truncated)";
}

}  // namespace Truncate

}  // namespace codeloop
