#pragma once
#include "registry.hpp"
#include <BS_thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace paragate {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "para-mcp-server";
constexpr const char* kServerVersion = "1.0.0";

// JSON-RPC 2.0 error codes
namespace rpc_error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace rpc_error

// Delivers one JSON-RPC response to whoever sent the request. May be called
// from a worker thread.
using ReplyFn = std::function<void(const nlohmann::json&)>;

// MCP message layer shared by every transport. Transports only frame bytes
// and hand decoded messages here.
//
// Methods: initialize, ping, tools/list, tools/call, notifications/*.
// tools/call runs on the thread pool so a slow external process never holds
// up other requests of the same session; everything else replies inline. The
// pool's thread count is the cap on simultaneous external processes.
class McpServer {
public:
    McpServer(const ToolRegistry& registry, BS::thread_pool& pool);

    void handle_message(const nlohmann::json& message, ReplyFn reply);

    // Run one tools/call synchronously and build its MCP result object
    nlohmann::json call_tool(const nlohmann::json& params) const;

    static nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
    static nlohmann::json make_error(const nlohmann::json& id, int code,
                                     const std::string& message);

    // Wire form of a message. Invalid UTF-8 from the external program is
    // replaced instead of failing the whole response.
    static std::string serialize(const nlohmann::json& message, int indent = -1);

private:
    nlohmann::json initialize_result(const nlohmann::json& params) const;

    const ToolRegistry& registry_;
    BS::thread_pool& pool_;
};

} // namespace paragate
