#pragma once
#include "../registry.hpp"

namespace paragate {

// Register the fifteen para_* tools (read-only, write and metadata tools).
void register_para_tools(ToolRegistry& registry);

// Registry with every para_* tool registered, bound to `runner`.
ToolRegistry build_para_registry(ProcessRunner& runner, InvokeSettings settings);

} // namespace paragate
