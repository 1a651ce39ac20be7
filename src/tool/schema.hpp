#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace codeloop::schema {

// Validate a value against the JSON Schema subset tools declare:
// type (string or list), enum, required, properties, additionalProperties, items.
// Returns the first violation, or nullopt when the value conforms.
std::optional<std::string> validate(const json &schema, const json &value, const std::string &where = "arguments");

}  // namespace codeloop::schema
