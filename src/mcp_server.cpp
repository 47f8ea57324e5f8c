#include "mcp_server.hpp"
#include <exception>
#include <iostream>

namespace paragate {

McpServer::McpServer(const ToolRegistry& registry, BS::thread_pool& pool)
    : registry_(registry)
    , pool_(pool)
{}

nlohmann::json McpServer::make_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json McpServer::make_error(const nlohmann::json& id, int code,
                                     const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

std::string McpServer::serialize(const nlohmann::json& message, int indent) {
    return message.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json McpServer::initialize_result(const nlohmann::json& params) const {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        // Echo the client's version when it is one we speak
        std::string requested = params["protocolVersion"].get<std::string>();
        if (requested == "2024-11-05" || requested == "2025-03-26") version = requested;
    }
    return {
        {"protocolVersion", version},
        {"capabilities", {{"tools", {{"listChanged", false}}}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
    };
}

nlohmann::json McpServer::call_tool(const nlohmann::json& params) const {
    const std::string name = params.at("name").get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

    ToolResult result = registry_.dispatch(name, arguments);
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", serialize(result.to_json(), 2)}}
        })},
        {"isError", result.is_error()}
    };
}

void McpServer::handle_message(const nlohmann::json& message, ReplyFn reply) {
    if (!message.is_object()) {
        reply(make_error(nullptr, rpc_error::InvalidRequest, "Invalid Request"));
        return;
    }

    const bool has_id = message.contains("id");
    const nlohmann::json id = has_id ? message["id"] : nlohmann::json(nullptr);

    if (!message.contains("method") || !message["method"].is_string()) {
        // Responses from the client to server-initiated requests: nothing to do
        if (message.contains("result") || message.contains("error")) return;
        if (has_id) reply(make_error(id, rpc_error::InvalidRequest, "Invalid Request"));
        return;
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json params = message.value("params", nlohmann::json::object());

    // Notifications never get a response
    if (!has_id) {
        if (method.rfind("notifications/", 0) != 0) {
            std::cerr << "[gateway] Ignoring notification: " << method << "\n";
        }
        return;
    }

    if (method == "initialize") {
        reply(make_result(id, initialize_result(params)));
    } else if (method == "ping") {
        reply(make_result(id, nlohmann::json::object()));
    } else if (method == "tools/list") {
        reply(make_result(id, {{"tools", registry_.tools_list()}}));
    } else if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            reply(make_error(id, rpc_error::InvalidParams, "Missing tool name"));
            return;
        }
        // Detached tasks must not throw
        pool_.detach_task([this, id, params, reply]() {
            try {
                reply(make_result(id, call_tool(params)));
            } catch (const std::exception& e) {
                std::cerr << "[gateway] tools/call failed: " << e.what() << "\n";
                reply(make_error(id, rpc_error::InternalError, "Internal error"));
            }
        });
    } else {
        reply(make_error(id, rpc_error::MethodNotFound, "Method not found: " + method));
    }
}

} // namespace paragate
