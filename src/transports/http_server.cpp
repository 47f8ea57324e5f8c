#include "http_server.hpp"
#include "../util.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <vector>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace paragate {

namespace {

constexpr size_t kMaxHeadBytes = 16384;
constexpr const char* kHeadTerminator = "\r\n\r\n";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Percent-decoding for query strings ('+' is a space)
std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    for (const auto& item : split(query, '&')) {
        if (item.empty()) continue;
        auto eq = item.find('=');
        std::string key = url_decode(item.substr(0, eq));
        params[key] = eq == std::string::npos ? "" : url_decode(item.substr(eq + 1));
    }
    return params;
}

bool is_digits(const std::string& s, size_t max_len) {
    return !s.empty() && s.size() <= max_len &&
           s.find_first_not_of("0123456789") == std::string::npos;
}

bool send_fully(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string status_line(int status) {
    return "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
}

void reply(int fd, int status, const std::string& content_type, const std::string& body) {
    std::ostringstream out;
    out << status_line(status)
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    send_fully(fd, out.str());
}

void reply_stream_head(int fd, int status, const std::string& content_type) {
    std::ostringstream out;
    out << status_line(status)
        << "Content-Type: " << content_type << "\r\n"
        << "Cache-Control: no-cache\r\n"
        << "Connection: keep-alive\r\n"
        << "X-Accel-Buffering: no\r\n\r\n";
    send_fully(fd, out.str());
}

void close_if_open(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it == query_params.end() ? std::string{} : it->second;
}

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string port_text = addr.substr(colon + 1);
    if (!is_digits(port_text, 5)) return false;
    int value = std::stoi(port_text);
    if (value > 65535 || (value == 0 && !allow_ephemeral)) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool parse_request_head(const std::string& head, HttpRequest& req) {
    std::istringstream lines(head);
    std::string line;
    if (!std::getline(lines, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream request_line(line);
    std::string target, version;
    if (!(request_line >> req.method >> target >> version)) return false;
    if (version.rfind("HTTP/", 0) != 0) return false;

    auto question = target.find('?');
    req.path = target.substr(0, question);
    if (question != std::string::npos) {
        req.query_params = parse_query(target.substr(question + 1));
    }

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

// ── StreamWriter ──────────────────────────────────────────────────────────────

bool StreamWriter::write(const std::string& data) {
    if (!running_.load()) return false;
    return send_fully(fd_, data);
}

bool StreamWriter::peer_closed() const {
    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 0) <= 0) return false;
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) return true;
    if (pfd.revents & POLLIN) {
        char peek;
        ssize_t n = ::recv(fd_, &peek, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0) return true;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return true;
    }
    return false;
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::close_listener() {
    close_if_open(server_fd_);
    close_if_open(shutdown_pipe_[0]);
    close_if_open(shutdown_pipe_[1]);
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        return false;
    }

    if (::pipe2(shutdown_pipe_, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        error = std::string("socket failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }

    int on = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#ifdef SO_NOSIGPIPE
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on));
#endif

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }
    if (::listen(server_fd_, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
        close_listener();
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    char wake = 1;
    ssize_t ignored = ::write(shutdown_pipe_[1], &wake, 1);
    (void)ignored;
    if (thread_.joinable()) thread_.join();

    // Unblock connection threads still reading or streaming
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (auto& [id, conn] : connections_) {
            if (conn.fd >= 0) ::shutdown(conn.fd, SHUT_RDWR);
            threads.push_back(std::move(conn.thread));
        }
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_.clear();
    }

    close_listener();
}

void HttpServer::reap_finished() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.done) {
                finished.push_back(std::move(it->second.thread));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
}

void HttpServer::accept_loop() {
    struct pollfd watch[2];
    watch[0].fd = server_fd_;
    watch[1].fd = shutdown_pipe_[0];

    while (running_.load()) {
        watch[0].events = watch[1].events = POLLIN;
        watch[0].revents = watch[1].revents = 0;

        int ready = ::poll(watch, 2, 1000);
        reap_finished();
        if (ready <= 0) continue;
        if (watch[1].revents & POLLIN) break;
        if ((watch[0].revents & POLLIN) == 0) continue;

        int client = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) continue;

        struct timeval read_timeout{10, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &read_timeout, sizeof(read_timeout));

        std::lock_guard<std::mutex> lock(conn_mutex_);
        uint64_t id = next_conn_id_++;
        auto& conn = connections_[id];
        conn.fd = client;
        conn.thread = std::thread([this, id]() { serve_connection(id); });
    }
}

void HttpServer::serve_connection(uint64_t id) {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        fd = connections_[id].fd;
    }

    try {
        handle_connection(fd);
    } catch (const std::exception& e) {
        std::cerr << "[http] Connection error: " << e.what() << "\n";
    }

    std::lock_guard<std::mutex> lock(conn_mutex_);
    auto& conn = connections_[id];
    close_if_open(conn.fd);
    conn.done = true;
}

void HttpServer::handle_connection(int fd) const {
    // Request head, capped
    std::string data;
    char chunk[1024];
    size_t head_end;
    while ((head_end = data.find(kHeadTerminator)) == std::string::npos) {
        if (data.size() > kMaxHeadBytes) {
            reply(fd, 400, "text/plain", "Request head too large");
            return;
        }
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        data.append(chunk, static_cast<size_t>(n));
    }

    HttpRequest req;
    if (!parse_request_head(data.substr(0, head_end), req)) {
        reply(fd, 400, "text/plain", "Malformed request");
        return;
    }

    size_t body_len = 0;
    auto length = req.headers.find("content-length");
    if (length != req.headers.end()) {
        if (!is_digits(length->second, 12)) {
            reply(fd, 400, "text/plain", "Invalid Content-Length");
            return;
        }
        body_len = static_cast<size_t>(std::stoull(length->second));
    }
    if (body_len > max_body_) {
        reply(fd, 413, "text/plain", "Payload too large");
        return;
    }

    req.body = data.substr(head_end + std::strlen(kHeadTerminator));
    while (req.body.size() < body_len) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            reply(fd, 400, "text/plain", "Incomplete body");
            return;
        }
        req.body.append(chunk, static_cast<size_t>(n));
    }
    req.body.resize(body_len);

    HttpResponse resp = handler_(req);
    if (!resp.stream) {
        reply(fd, resp.status, resp.content_type, resp.body);
        return;
    }

    reply_stream_head(fd, resp.status, resp.content_type);
    StreamWriter writer(fd, running_);
    resp.stream(writer);
}

} // namespace paragate
