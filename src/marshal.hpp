#pragma once
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace paragate {

// Trailing flag that asks the external program for structured output.
constexpr const char* kStructuredOutputFlag = "--json";

// Build the external program's argument vector for a tool from a payload
// that has already been validated (defaults applied). The vector always ends
// with kStructuredOutputFlag. Returns a MissingField error when a
// conditionally required field is absent; `args` is left untouched then.
std::optional<ToolResult> build_arguments(const ToolDescriptor& tool,
                                          const nlohmann::json& payload,
                                          std::vector<std::string>& args);

// Throws std::invalid_argument if the tool's schema does not declare every
// field its marshaling rule reads, or a rule that needs a subcommand has none.
void check_rule_fields(const ToolDescriptor& tool);

} // namespace paragate
