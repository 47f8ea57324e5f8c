#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>

namespace paragate {

enum class ErrorKind {
    UnknownTool,
    MissingField,
    InvalidValue,
    LaunchError,
    Timeout,
    ExternalToolError,
    Internal
};

const char* error_kind_name(ErrorKind kind);

// Outcome of one tool invocation. Exactly one of: a structured document,
// raw text the external program printed that was not JSON, or an error.
class ToolResult {
public:
    enum class Kind { Structured, RawFallback, Error };

    static ToolResult structured(nlohmann::json value);
    static ToolResult raw_fallback(std::string text);
    static ToolResult failure(ErrorKind error, std::string message);

    Kind kind() const { return kind_; }
    bool is_error() const { return kind_ == Kind::Error; }

    // Structured document (null unless kind() == Structured)
    const nlohmann::json& value() const { return value_; }
    nlohmann::json& value() { return value_; }

    // Raw stdout text for RawFallback
    const std::string& raw_text() const { return text_; }

    // Error kind and message; only meaningful when is_error()
    ErrorKind error() const { return error_; }
    const std::string& message() const { return text_; }

    // Wire form delivered to callers:
    //   Structured  -> the document itself
    //   RawFallback -> {"output": text, "raw": true}
    //   Error       -> {"error": message}
    nlohmann::json to_json() const;

private:
    ToolResult() = default;

    Kind kind_ = Kind::Structured;
    nlohmann::json value_;
    std::string text_;
    ErrorKind error_ = ErrorKind::Internal;
};

// How a tool's validated payload turns into arguments. Closed set: every
// value must be handled by build_arguments() and check_rule_fields().
enum class MarshalRule {
    Bare,    // <sub>
    Item,    // <sub> <type> <name>
    List,    // list [<type>]
    Search,  // search <scope> [<name>] <query> [-C n] [--case-sensitive]
    Agenda,  // agenda --days n (--project p | --area a | --scope s)
    Path     // path <location> [<name>]
};

using PostProcessHook = std::function<void(ToolResult&)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    MarshalRule rule = MarshalRule::Bare;
    std::string subcommand;  // external program subcommand for the rule
    PostProcessHook post_process;  // optional
};

class DuplicateToolError : public std::invalid_argument {
public:
    explicit DuplicateToolError(const std::string& name)
        : std::invalid_argument("Duplicate tool: " + name) {}
};

} // namespace paragate
