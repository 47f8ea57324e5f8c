#pragma once
#include <string>
#include <functional>
#include <map>
#include <unordered_map>
#include <atomic>
#include <mutex>
#include <thread>
#include <cstdint>

namespace paragate {

struct HttpRequest {
    std::string method;
    std::string path;  // target without the query string
    std::map<std::string, std::string> query_params;  // decoded
    std::map<std::string, std::string> headers;       // lowercase names
    std::string body;

    std::string query_param(const std::string& key) const;  // "" if absent
};

// Write side of a long-lived streaming response.
class StreamWriter {
public:
    StreamWriter(int fd, const std::atomic<bool>& running) : fd_(fd), running_(running) {}

    // Send bytes; false once the peer is gone or the server is stopping.
    bool write(const std::string& data);

    // True if the peer closed its end (checked without blocking).
    bool peer_closed() const;

private:
    int fd_;
    const std::atomic<bool>& running_;
};

using StreamFn = std::function<void(StreamWriter&)>;

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
    // When set, headers are sent without Content-Length and the connection
    // stays open until the function returns.
    StreamFn    stream;
};

// Small threaded HTTP/1.1 server on POSIX sockets. Every connection gets its
// own thread, so long-lived streams and short requests coexist. Responses
// close the connection when done.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr is "host:port"; port 0 binds an ephemeral port.
    // Request bodies above max_body bytes are refused with 413.
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Bind and start accepting on a background thread
    bool start(std::string& error);

    // Stop accepting, unblock open connections and join every thread.
    void stop();

    // Port actually bound
    uint16_t bound_port() const { return bound_port_; }

private:
    struct Connection {
        int fd = -1;
        std::thread thread;
        bool done = false;
    };

    void accept_loop();
    void serve_connection(uint64_t id);
    void handle_connection(int client_fd) const;
    void reap_finished();
    void close_listener();

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::unordered_map<uint64_t, Connection> connections_;
    uint64_t next_conn_id_ = 0;
};

// Split "host:port". Port 0 is accepted only with allow_ephemeral.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral = false);

// Fill method, path, query parameters and headers from a request head
// (request line plus header lines, without the blank line). False if the
// request line is malformed.
bool parse_request_head(const std::string& head, HttpRequest& req);

} // namespace paragate
