#include "normalizer.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace paragate {

ToolResult normalize_output(const std::string& stdout_text) {
    try {
        return ToolResult::structured(nlohmann::json::parse(stdout_text));
    } catch (const nlohmann::json::parse_error&) {
        return ToolResult::raw_fallback(stdout_text);
    }
}

ToolResult normalize_outcome(const ProcessOutcome& outcome) {
    if (auto err = outcome_error(outcome)) return *err;

    if (trim(outcome.stdout_text).empty()) {
        return ToolResult::structured({{"success", true}, {"returncode", outcome.exit_code}});
    }
    return normalize_output(outcome.stdout_text);
}

} // namespace paragate
