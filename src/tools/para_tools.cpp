#include "para_tools.hpp"
#include <nlohmann/json.hpp>

namespace paragate {

namespace {

constexpr const char* kServerContextNote =
    "In server context, this returns the path. Use a client to actually ";

// Schema shared by every tool that addresses one project or area.
nlohmann::json item_schema(const std::string& type_desc, const std::string& name_desc) {
    return {
        {"type", "object"},
        {"properties", {
            {"type", {
                {"type", "string"},
                {"enum", nlohmann::json::array({"project", "area"})},
                {"description", type_desc}
            }},
            {"name", {
                {"type", "string"},
                {"description", name_desc}
            }}
        }},
        {"required", nlohmann::json::array({"type", "name"})}
    };
}

nlohmann::json empty_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolDescriptor item_tool(std::string name, std::string description, std::string subcommand,
                         const std::string& type_desc, const std::string& name_desc) {
    ToolDescriptor tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.input_schema = item_schema(type_desc, name_desc);
    tool.rule = MarshalRule::Item;
    tool.subcommand = std::move(subcommand);
    return tool;
}

ToolDescriptor bare_tool(std::string name, std::string description, std::string subcommand) {
    ToolDescriptor tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.input_schema = empty_schema();
    tool.rule = MarshalRule::Bare;
    tool.subcommand = std::move(subcommand);
    return tool;
}

ToolDescriptor list_tool() {
    ToolDescriptor tool;
    tool.name = "para_list";
    tool.description = "List all projects and/or areas in your PARA system. "
                       "Optionally filter by type.";
    tool.input_schema = nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "type": {
                "type": "string",
                "enum": ["project", "area", "all"],
                "description": "Filter by type: 'project', 'area', or 'all' (default: all)",
                "default": "all"
            }
        }
    })json");
    tool.rule = MarshalRule::List;
    return tool;
}

ToolDescriptor search_tool() {
    ToolDescriptor tool;
    tool.name = "para_search";
    tool.description = "Search for text in Para files with context. "
                       "Fast full-text search using ripgrep.";
    tool.input_schema = nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "scope": {
                "type": "string",
                "enum": ["project", "area", "projects", "areas", "resources", "archive", "all"],
                "description": "Search scope: 'project' (specific), 'area' (specific), 'projects' (all), 'areas' (all), 'resources', 'archive', or 'all'"
            },
            "name": {
                "type": "string",
                "description": "Name of the project or area (required when scope is 'project' or 'area')"
            },
            "query": {
                "type": "string",
                "description": "Search query text"
            },
            "context": {
                "type": "integer",
                "description": "Number of context lines before/after each match (default: 2)",
                "default": 2
            },
            "caseSensitive": {
                "type": "boolean",
                "description": "Whether to perform case-sensitive search (default: false)",
                "default": false
            }
        },
        "required": ["scope", "query"]
    })json");
    tool.rule = MarshalRule::Search;
    return tool;
}

ToolDescriptor agenda_tool() {
    ToolDescriptor tool;
    tool.name = "para_agenda";
    tool.description = "Export org-mode agenda from Para projects and areas. "
                       "Shows TODOs, deadlines, and scheduled items.";
    tool.input_schema = nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "days": {
                "type": "integer",
                "description": "Number of days in agenda view (default: 7 for weekly view)",
                "default": 7
            },
            "project": {
                "type": "string",
                "description": "Limit agenda to specific project name"
            },
            "area": {
                "type": "string",
                "description": "Limit agenda to specific area name"
            },
            "scope": {
                "type": "string",
                "enum": ["projects", "areas", "all"],
                "description": "Scope: 'projects', 'areas', or 'all' (default: all)",
                "default": "all"
            }
        }
    })json");
    tool.rule = MarshalRule::Agenda;
    return tool;
}

ToolDescriptor path_tool() {
    ToolDescriptor tool;
    tool.name = "para_path";
    tool.description = "Get PARA system paths (home, resources, archive, "
                       "or path to a specific project/area).";
    tool.input_schema = nlohmann::json::parse(R"json({
        "type": "object",
        "properties": {
            "location": {
                "type": "string",
                "enum": ["home", "resources", "archive", "project", "area"],
                "description": "Location type to get path for"
            },
            "name": {
                "type": "string",
                "description": "Name of project or area (required if location is 'project' or 'area')"
            }
        },
        "required": ["location"]
    })json");
    tool.rule = MarshalRule::Path;
    return tool;
}

// para_open: directory lookup plus the journal file inside it
void add_journal_path(ToolResult& result) {
    if (result.kind() != ToolResult::Kind::Structured) return;
    auto& value = result.value();
    if (!value.is_object() || !value.contains("path")) return;

    const auto& path = value["path"];
    std::string dir = path.is_string() ? path.get<std::string>() : path.dump();
    value["journalPath"] = dir + "/journal.org";
    value["note"] = std::string(kServerContextNote) + "open the file.";
}

// para_reveal annotates any object, the raw-text fallback included
void add_reveal_note(ToolResult& result) {
    if (result.kind() == ToolResult::Kind::RawFallback) {
        result = ToolResult::structured(result.to_json());
    }
    if (result.kind() != ToolResult::Kind::Structured) return;
    auto& value = result.value();
    if (!value.is_object()) return;
    value["note"] = std::string(kServerContextNote) + "reveal the folder.";
}

} // namespace

void register_para_tools(ToolRegistry& registry) {
    const std::string item_type = "Type of item: 'project' or 'area'";
    const std::string item_name = "Name of the project or area";

    // Read-only tools
    registry.register_tool(list_tool());
    registry.register_tool(item_tool("para_read",
        "Read the entire journal.org file content for a specific project or area.",
        "read", item_type, item_name));
    registry.register_tool(item_tool("para_headings",
        "Extract org-mode headings (* ...) from the journal file of a project or area.",
        "headings", item_type, item_name));
    registry.register_tool(search_tool());
    registry.register_tool(agenda_tool());
    registry.register_tool(bare_tool("para_environment",
        "Display environment configuration and validate Para setup "
        "(PARA_HOME, PARA_ARCHIVE, etc.).",
        "environment"));
    registry.register_tool(bare_tool("para_version",
        "Get Para version information.", "version"));
    registry.register_tool(bare_tool("para_ai_overview",
        "Get comprehensive documentation about Para for AI understanding, "
        "including all commands and usage.",
        "ai-overview"));
    registry.register_tool(item_tool("para_directory",
        "Get the absolute directory path for a specific project or area.",
        "directory", item_type, item_name));
    registry.register_tool(path_tool());

    // Write tools
    registry.register_tool(item_tool("para_create",
        "Create a new project or area in your PARA system. "
        "This will create the directory and journal.org file.",
        "create", "Type of item to create: 'project' or 'area'",
        "Name of the project or area to create"));
    registry.register_tool(item_tool("para_archive",
        "Archive a completed project or area by moving it to the PARA_ARCHIVE location.",
        "archive", "Type of item to archive: 'project' or 'area'",
        "Name of the project or area to archive"));
    registry.register_tool(item_tool("para_delete",
        "Permanently delete a project or area. This action cannot be undone.",
        "delete", "Type of item to delete: 'project' or 'area'",
        "Name of the project or area to delete"));

    // Metadata tools (both resolve through `directory`)
    auto open = item_tool("para_open",
        "Get the path to the journal.org file for a project or area. "
        "In server context, returns the path.",
        "directory", item_type, item_name);
    open.post_process = add_journal_path;
    registry.register_tool(std::move(open));

    auto reveal = item_tool("para_reveal",
        "Get the directory path for a project or area. In server context, returns the path.",
        "directory", item_type, item_name);
    reveal.post_process = add_reveal_note;
    registry.register_tool(std::move(reveal));
}

ToolRegistry build_para_registry(ProcessRunner& runner, InvokeSettings settings) {
    ToolRegistry registry(runner, std::move(settings));
    register_para_tools(registry);
    return registry;
}

} // namespace paragate
