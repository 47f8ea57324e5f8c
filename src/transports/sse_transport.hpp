#pragma once
#include "http_server.hpp"
#include "../mcp_server.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace paragate {

// One open GET /sse stream. Responses produced by POSTed requests are queued
// here and written out by the stream's connection thread.
struct SseSession {
    std::string id;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> outbox;
    bool closed = false;

    void push(std::string message);
    void close();
};

class SessionManager {
public:
    // Create a session with a fresh random id
    std::shared_ptr<SseSession> create();

    // Look up a session (nullptr if unknown)
    std::shared_ptr<SseSession> find(const std::string& session_id) const;

    void remove(const std::string& session_id);

    // Close every session so their streams return
    void close_all();

    std::vector<std::string> list_sessions() const;
    size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<SseSession>> sessions_;
    mutable std::mutex mutex_;
};

// MCP over HTTP with server-sent events:
//   GET  /                          liveness document
//   GET  /sse                       event stream, first event names the POST endpoint
//   POST /messages/?session_id=ID   one JSON-RPC message, answered on the stream
class SseTransport {
public:
    SseTransport(McpServer& server, std::chrono::milliseconds keepalive);

    HttpResponse handle_request(const HttpRequest& req);

    static nlohmann::json health_document();

    SessionManager& sessions() { return sessions_; }

    // Wake every open stream so HttpServer::stop() can join them
    void shutdown();

private:
    HttpResponse open_stream();
    HttpResponse post_message(const HttpRequest& req);
    void run_stream(const std::shared_ptr<SseSession>& session, StreamWriter& writer);

    McpServer& server_;
    std::chrono::milliseconds keepalive_;
    SessionManager sessions_;
};

} // namespace paragate
