#pragma once
#include "../mcp_server.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <mutex>

namespace paragate {

// Local duplex channel: one JSON-RPC message per line on stdin, responses
// one per line on stdout. One session for the life of the process.
class StdioTransport {
public:
    StdioTransport(McpServer& server, BS::thread_pool& pool,
                   std::istream& in = std::cin, std::ostream& out = std::cout);

    // Serve until EOF on input, then wait for in-flight calls to answer.
    void run();

    // Thread-safe: responses from concurrent calls never interleave.
    void write_message(const nlohmann::json& message);

private:
    McpServer& server_;
    BS::thread_pool& pool_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
};

} // namespace paragate
