#include "tool/schema.hpp"

namespace codeloop::schema {

namespace {

bool matches_type(const std::string &type, const json &value) {
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  if (type == "string") return value.is_string();
  if (type == "integer") return value.is_number_integer();
  if (type == "number") return value.is_number();
  if (type == "boolean") return value.is_boolean();
  if (type == "null") return value.is_null();
  return true;  // Unknown type names do not constrain
}

std::string type_name(const json &value) {
  if (value.is_number_integer()) return "integer";
  return value.type_name();
}

}  // namespace

std::optional<std::string> validate(const json &schema, const json &value, const std::string &where) {
  if (!schema.is_object()) {
    return std::nullopt;
  }

  if (schema.contains("type")) {
    const auto &type = schema["type"];
    bool ok = false;
    std::string expected;
    if (type.is_string()) {
      expected = type.get<std::string>();
      ok = matches_type(expected, value);
    } else if (type.is_array()) {
      for (const auto &t : type) {
        if (!t.is_string()) continue;
        if (!expected.empty()) expected += "|";
        expected += t.get<std::string>();
        ok = ok || matches_type(t.get<std::string>(), value);
      }
    } else {
      ok = true;
    }
    if (!ok) {
      return where + ": expected " + expected + ", got " + type_name(value);
    }
  }

  if (schema.contains("enum") && schema["enum"].is_array()) {
    bool found = false;
    for (const auto &candidate : schema["enum"]) {
      if (candidate == value) {
        found = true;
        break;
      }
    }
    if (!found) {
      return where + ": value " + value.dump() + " not in " + schema["enum"].dump();
    }
  }

  if (value.is_object()) {
    if (schema.contains("required") && schema["required"].is_array()) {
      for (const auto &key : schema["required"]) {
        if (key.is_string() && !value.contains(key.get<std::string>())) {
          return where + ": missing required parameter '" + key.get<std::string>() + "'";
        }
      }
    }

    const json properties = schema.contains("properties") ? schema["properties"] : json::object();
    const json additional = schema.contains("additionalProperties") ? schema["additionalProperties"] : json(true);

    for (auto it = value.begin(); it != value.end(); ++it) {
      auto prop = properties.find(it.key());
      if (prop != properties.end()) {
        if (auto error = validate(*prop, it.value(), where + "." + it.key())) {
          return error;
        }
      } else if (additional.is_boolean() && !additional.get<bool>()) {
        return where + ": unexpected parameter '" + it.key() + "'";
      } else if (additional.is_object()) {
        if (auto error = validate(additional, it.value(), where + "." + it.key())) {
          return error;
        }
      }
    }
  }

  if (value.is_array() && schema.contains("items")) {
    for (size_t i = 0; i < value.size(); ++i) {
      if (auto error = validate(schema["items"], value[i], where + "[" + std::to_string(i) + "]")) {
        return error;
      }
    }
  }

  return std::nullopt;
}

}  // namespace codeloop::schema
