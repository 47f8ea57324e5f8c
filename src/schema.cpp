#include "schema.hpp"
#include <stdexcept>

namespace paragate {

static bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "number")  return value.is_number();
    return false;
}

static std::string enum_list(const nlohmann::json& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v.is_string() ? v.get<std::string>() : v.dump();
    }
    return out;
}

std::optional<ToolResult> validate_payload(const nlohmann::json& schema,
                                           const nlohmann::json& payload,
                                           nlohmann::json& out) {
    if (payload.is_null()) {
        out = nlohmann::json::object();
    } else if (payload.is_object()) {
        out = payload;
    } else {
        return ToolResult::failure(ErrorKind::InvalidValue, "Arguments must be a JSON object");
    }

    // Explicit nulls are treated as absent so defaults still apply.
    for (auto it = out.begin(); it != out.end();) {
        if (it->is_null()) it = out.erase(it);
        else ++it;
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& field : schema["required"]) {
            const auto name = field.get<std::string>();
            if (!out.contains(name)) {
                return ToolResult::failure(ErrorKind::MissingField,
                                           "Missing required parameter: " + name);
            }
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return std::nullopt;
    }

    for (const auto& [name, prop] : schema["properties"].items()) {
        if (!out.contains(name)) {
            if (prop.contains("default")) out[name] = prop["default"];
            continue;
        }

        const auto& value = out[name];
        const std::string type = prop.value("type", "");
        if (!type.empty() && !matches_type(type, value)) {
            return ToolResult::failure(ErrorKind::InvalidValue,
                "Invalid type for '" + name + "': expected " + type);
        }

        if (prop.contains("enum") && prop["enum"].is_array()) {
            bool found = false;
            for (const auto& allowed : prop["enum"]) {
                if (allowed == value) { found = true; break; }
            }
            if (!found) {
                return ToolResult::failure(ErrorKind::InvalidValue,
                    "Invalid value for '" + name + "': expected one of " +
                    enum_list(prop["enum"]));
            }
        }
    }

    return std::nullopt;
}

bool schema_declares(const nlohmann::json& schema, const std::string& field) {
    return schema.contains("properties") && schema["properties"].is_object() &&
           schema["properties"].contains(field);
}

void check_schema(const std::string& tool_name, const nlohmann::json& schema) {
    if (!schema.is_object() || schema.value("type", "") != "object") {
        throw std::invalid_argument(tool_name + ": input schema must be an object schema");
    }
    if (schema.contains("properties") && !schema["properties"].is_object()) {
        throw std::invalid_argument(tool_name + ": 'properties' must be an object");
    }
    if (schema.contains("required")) {
        if (!schema["required"].is_array()) {
            throw std::invalid_argument(tool_name + ": 'required' must be an array");
        }
        for (const auto& field : schema["required"]) {
            if (!field.is_string() || !schema_declares(schema, field.get<std::string>())) {
                throw std::invalid_argument(tool_name + ": required field " + field.dump() +
                                            " is not a declared property");
            }
        }
    }
}

} // namespace paragate
