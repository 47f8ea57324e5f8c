#include "marshal.hpp"
#include "schema.hpp"
#include <stdexcept>

namespace paragate {

namespace {

// The external program's own default for search context lines. Only values
// that differ from it are passed explicitly.
constexpr long long kDefaultSearchContext = 2;

// String field value, or "" when absent. Empty strings count as absent.
std::string string_field(const nlohmann::json& payload, const char* field) {
    auto it = payload.find(field);
    if (it == payload.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool bool_field(const nlohmann::json& payload, const char* field) {
    auto it = payload.find(field);
    return it != payload.end() && it->is_boolean() && it->get<bool>();
}

std::optional<long long> int_field(const nlohmann::json& payload, const char* field) {
    auto it = payload.find(field);
    if (it == payload.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<long long>();
}

bool is_single_item_scope(const std::string& value) {
    return value == "project" || value == "area";
}

std::optional<ToolResult> marshal_search(const nlohmann::json& payload,
                                         std::vector<std::string>& out) {
    std::string scope = string_field(payload, "scope");
    out.push_back("search");
    out.push_back(scope);

    if (is_single_item_scope(scope)) {
        std::string name = string_field(payload, "name");
        if (name.empty()) {
            return ToolResult::failure(ErrorKind::MissingField,
                "'name' is required when scope is '" + scope + "'");
        }
        out.push_back(name);
    }

    out.push_back(string_field(payload, "query"));

    auto context = int_field(payload, "context");
    if (context && *context != kDefaultSearchContext) {
        out.push_back("-C");
        out.push_back(std::to_string(*context));
    }
    if (bool_field(payload, "caseSensitive")) {
        out.push_back("--case-sensitive");
    }
    return std::nullopt;
}

void marshal_agenda(const nlohmann::json& payload, std::vector<std::string>& out) {
    out.push_back("agenda");
    out.push_back("--days");
    out.push_back(std::to_string(int_field(payload, "days").value_or(7)));

    // project beats area beats scope, independent of payload order
    std::string project = string_field(payload, "project");
    std::string area = string_field(payload, "area");
    if (!project.empty()) {
        out.push_back("--project");
        out.push_back(project);
    } else if (!area.empty()) {
        out.push_back("--area");
        out.push_back(area);
    } else {
        std::string scope = string_field(payload, "scope");
        out.push_back("--scope");
        out.push_back(scope.empty() ? "all" : scope);
    }
}

std::optional<ToolResult> marshal_path(const nlohmann::json& payload,
                                       std::vector<std::string>& out) {
    std::string location = string_field(payload, "location");
    out.push_back("path");
    out.push_back(location);
    if (is_single_item_scope(location)) {
        std::string name = string_field(payload, "name");
        if (name.empty()) {
            return ToolResult::failure(ErrorKind::MissingField,
                "Parameter 'name' is required when location is '" + location + "'");
        }
        out.push_back(name);
    }
    return std::nullopt;
}

} // namespace

std::optional<ToolResult> build_arguments(const ToolDescriptor& tool,
                                          const nlohmann::json& payload,
                                          std::vector<std::string>& args) {
    std::vector<std::string> out;

    switch (tool.rule) {
        case MarshalRule::Bare:
            out.push_back(tool.subcommand);
            break;

        case MarshalRule::Item:
            out.push_back(tool.subcommand);
            out.push_back(string_field(payload, "type"));
            out.push_back(string_field(payload, "name"));
            break;

        case MarshalRule::List: {
            out.push_back("list");
            std::string type = string_field(payload, "type");
            if (!type.empty() && type != "all") out.push_back(type);
            break;
        }

        case MarshalRule::Search:
            if (auto err = marshal_search(payload, out)) return err;
            break;

        case MarshalRule::Agenda:
            marshal_agenda(payload, out);
            break;

        case MarshalRule::Path:
            if (auto err = marshal_path(payload, out)) return err;
            break;
    }

    out.push_back(kStructuredOutputFlag);
    args = std::move(out);
    return std::nullopt;
}

void check_rule_fields(const ToolDescriptor& tool) {
    std::vector<const char*> fields;
    bool needs_subcommand = false;

    switch (tool.rule) {
        case MarshalRule::Bare:
            needs_subcommand = true;
            break;
        case MarshalRule::Item:
            needs_subcommand = true;
            fields = {"type", "name"};
            break;
        case MarshalRule::List:
            fields = {"type"};
            break;
        case MarshalRule::Search:
            fields = {"scope", "name", "query", "context", "caseSensitive"};
            break;
        case MarshalRule::Agenda:
            fields = {"days", "project", "area", "scope"};
            break;
        case MarshalRule::Path:
            fields = {"location", "name"};
            break;
    }

    if (needs_subcommand && tool.subcommand.empty()) {
        throw std::invalid_argument(tool.name + ": marshaling rule requires a subcommand");
    }
    for (const char* field : fields) {
        if (!schema_declares(tool.input_schema, field)) {
            throw std::invalid_argument(tool.name + ": schema does not declare '" +
                                        field + "' used by its marshaling rule");
        }
    }
}

} // namespace paragate
