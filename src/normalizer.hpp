#pragma once
#include "process.hpp"
#include "tool.hpp"
#include <string>

namespace paragate {

// Parse captured stdout as one JSON document. Output that does not parse is
// kept verbatim as a RawFallback result; this never yields an error.
ToolResult normalize_output(const std::string& stdout_text);

// Full outcome -> result: process failures become error results, a clean
// exit with blank stdout becomes {"success": true, "returncode": 0}, anything
// else goes through normalize_output().
ToolResult normalize_outcome(const ProcessOutcome& outcome);

} // namespace paragate
