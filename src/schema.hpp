#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace paragate {

// Validate a payload against a tool input schema (object schemas with
// string/integer/boolean properties, enum, default and required).
// On success fills `out` with the payload plus defaults for absent optional
// fields and returns nullopt. On failure returns a MissingField or
// InvalidValue error result.
std::optional<ToolResult> validate_payload(const nlohmann::json& schema,
                                           const nlohmann::json& payload,
                                           nlohmann::json& out);

// True if the schema declares a property with this name.
bool schema_declares(const nlohmann::json& schema, const std::string& field);

// Throws std::invalid_argument if the schema is not a well-formed object
// schema of the supported subset.
void check_schema(const std::string& tool_name, const nlohmann::json& schema);

} // namespace paragate
