#pragma once
#include "process.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace paragate {

// How the external program is launched for every tool
struct InvokeSettings {
    std::string program = "para";
    std::chrono::milliseconds timeout{30000};
    Environment environment;  // added to / overriding the inherited environment
};

// Tool name -> descriptor mapping. Filled once at startup, then only read:
// dispatch() is const and safe to call from many threads at once.
class ToolRegistry {
public:
    ToolRegistry(ProcessRunner& runner, InvokeSettings settings);

    // Throws DuplicateToolError for a repeated name, std::invalid_argument
    // for a schema that does not fit the tool's marshaling rule.
    void register_tool(ToolDescriptor tool);

    // Validate, marshal, run, normalize, post-process. Never throws: every
    // failure comes back as an error result.
    ToolResult dispatch(const std::string& name, const nlohmann::json& payload) const;

    const ToolDescriptor* find(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return tools_.size(); }

    // MCP tools/list payload, in registration order
    nlohmann::json tools_list() const;

    const InvokeSettings& settings() const { return settings_; }

private:
    ProcessRunner& runner_;
    InvokeSettings settings_;
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace paragate
