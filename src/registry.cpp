#include "registry.hpp"
#include "marshal.hpp"
#include "normalizer.hpp"
#include "schema.hpp"
#include "util.hpp"
#include <iostream>

namespace paragate {

ToolRegistry::ToolRegistry(ProcessRunner& runner, InvokeSettings settings)
    : runner_(runner)
    , settings_(std::move(settings))
{}

void ToolRegistry::register_tool(ToolDescriptor tool) {
    if (index_.count(tool.name) > 0) {
        throw DuplicateToolError(tool.name);
    }
    check_schema(tool.name, tool.input_schema);
    check_rule_fields(tool);

    index_[tool.name] = tools_.size();
    tools_.push_back(std::move(tool));
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& tool : tools_) {
        result.push_back(tool.name);
    }
    return result;
}

nlohmann::json ToolRegistry::tools_list() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools_) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return list;
}

ToolResult ToolRegistry::dispatch(const std::string& name,
                                  const nlohmann::json& payload) const {
    try {
        const ToolDescriptor* tool = find(name);
        if (!tool) {
            return ToolResult::failure(ErrorKind::UnknownTool, "Unknown tool: " + name);
        }

        nlohmann::json args;
        if (auto err = validate_payload(tool->input_schema, payload, args)) {
            return *err;
        }

        std::vector<std::string> argv;
        if (auto err = build_arguments(*tool, args, argv)) {
            return *err;
        }

        std::cerr << "[invoke] Executing: " << join_command(settings_.program, argv) << "\n";
        ProcessOutcome outcome = runner_.run(settings_.program, argv,
                                             settings_.timeout, settings_.environment);

        ToolResult result = normalize_outcome(outcome);
        if (result.is_error()) {
            std::cerr << "[invoke] " << name << " failed ("
                      << error_kind_name(result.error()) << "): "
                      << result.message() << "\n";
            return result;
        }

        if (tool->post_process) {
            tool->post_process(result);
        }
        return result;
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Error handling tool " << name << ": " << e.what() << "\n";
        return ToolResult::failure(ErrorKind::Internal,
                                   std::string("Internal error: ") + e.what());
    }
}

} // namespace paragate
