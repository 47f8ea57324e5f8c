#include "tool.hpp"

namespace paragate {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownTool:       return "UnknownTool";
        case ErrorKind::MissingField:      return "MissingField";
        case ErrorKind::InvalidValue:      return "InvalidValue";
        case ErrorKind::LaunchError:       return "LaunchError";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::ExternalToolError: return "ExternalToolError";
        case ErrorKind::Internal:          return "Internal";
    }
    return "Internal";
}

ToolResult ToolResult::structured(nlohmann::json value) {
    ToolResult r;
    r.kind_ = Kind::Structured;
    r.value_ = std::move(value);
    return r;
}

ToolResult ToolResult::raw_fallback(std::string text) {
    ToolResult r;
    r.kind_ = Kind::RawFallback;
    r.text_ = std::move(text);
    return r;
}

ToolResult ToolResult::failure(ErrorKind error, std::string message) {
    ToolResult r;
    r.kind_ = Kind::Error;
    r.error_ = error;
    r.text_ = std::move(message);
    return r;
}

nlohmann::json ToolResult::to_json() const {
    switch (kind_) {
        case Kind::Structured:
            return value_;
        case Kind::RawFallback:
            return {{"output", text_}, {"raw", true}};
        case Kind::Error:
            return {{"error", text_}};
    }
    return {{"error", text_}};
}

} // namespace paragate
