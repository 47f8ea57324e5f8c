#include "sse_transport.hpp"
#include "../sse.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>

namespace paragate {

// ── SseSession ────────────────────────────────────────────────────────────────

void SseSession::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) return;
        outbox.push_back(std::move(message));
    }
    cv.notify_one();
}

void SseSession::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    cv.notify_all();
}

// ── SessionManager ────────────────────────────────────────────────────────────

std::shared_ptr<SseSession> SessionManager::create() {
    auto session = std::make_shared<SseSession>();
    std::lock_guard<std::mutex> lock(mutex_);
    do {
        session->id = generate_session_id();
    } while (sessions_.count(session->id));
    sessions_[session->id] = session;
    return session;
}

std::shared_ptr<SseSession> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

void SessionManager::remove(const std::string& session_id) {
    std::shared_ptr<SseSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
}

void SessionManager::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, session] : sessions_) {
        session->close();
    }
}

std::vector<std::string> SessionManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ── SseTransport ──────────────────────────────────────────────────────────────

// Floor for the keep-alive interval; the stream loop waits at most this long.
static constexpr std::chrono::milliseconds kMinKeepalive{10};

SseTransport::SseTransport(McpServer& server, std::chrono::milliseconds keepalive)
    : server_(server)
    , keepalive_(std::max(keepalive, kMinKeepalive))
{}

nlohmann::json SseTransport::health_document() {
    return {
        {"status", "ok"},
        {"service", kServerName},
        {"transport", "sse"},
        {"sse_endpoint", "/sse"},
        {"messages_endpoint", "/messages/"},
    };
}

void SseTransport::shutdown() {
    sessions_.close_all();
}

static HttpResponse text_response(int status, const std::string& body) {
    HttpResponse resp;
    resp.status = status;
    resp.body = body;
    return resp;
}

HttpResponse SseTransport::handle_request(const HttpRequest& req) {
    if (req.path == "/") {
        if (req.method != "GET") return text_response(405, "Method Not Allowed");
        HttpResponse resp;
        resp.content_type = "application/json";
        resp.body = health_document().dump();
        return resp;
    }

    if (req.path == "/sse") {
        if (req.method != "GET") return text_response(405, "Method Not Allowed");
        return open_stream();
    }

    if (req.path == "/messages" || req.path == "/messages/") {
        if (req.method != "POST") return text_response(405, "Method Not Allowed");
        return post_message(req);
    }

    return text_response(404, "Not Found");
}

HttpResponse SseTransport::open_stream() {
    std::shared_ptr<SseSession> session;
    try {
        session = sessions_.create();
    } catch (const std::exception& e) {
        std::cerr << "[http] Failed to create session: " << e.what() << "\n";
        return text_response(500, "Failed to create session");
    }

    std::cerr << "[http] SSE session " << session->id << " opened\n";

    HttpResponse resp;
    resp.content_type = "text/event-stream";
    resp.stream = [this, session](StreamWriter& writer) {
        run_stream(session, writer);
    };
    return resp;
}

void SseTransport::run_stream(const std::shared_ptr<SseSession>& session,
                              StreamWriter& writer) {
    // Idle waits are sliced so a vanished client is noticed between keep-alives.
    const auto slice = std::min(keepalive_, std::chrono::milliseconds(1000));
    auto last_write = std::chrono::steady_clock::now();

    bool ok = writer.write(format_sse_event("endpoint",
                                            "/messages/?session_id=" + session->id));

    std::unique_lock<std::mutex> lock(session->mutex);
    while (ok) {
        session->cv.wait_for(lock, slice, [&session] {
            return session->closed || !session->outbox.empty();
        });
        if (session->closed) break;

        if (!session->outbox.empty()) {
            std::string message = std::move(session->outbox.front());
            session->outbox.pop_front();
            lock.unlock();
            ok = writer.write(format_sse_event("message", message));
            last_write = std::chrono::steady_clock::now();
            lock.lock();
            continue;
        }

        lock.unlock();
        if (writer.peer_closed()) {
            ok = false;
        } else if (std::chrono::steady_clock::now() - last_write >= keepalive_) {
            ok = writer.write(format_sse_comment("ping"));
            last_write = std::chrono::steady_clock::now();
        }
        lock.lock();
    }
    lock.unlock();

    sessions_.remove(session->id);
    std::cerr << "[http] SSE session " << session->id << " closed\n";
}

HttpResponse SseTransport::post_message(const HttpRequest& req) {
    std::string session_id = req.query_param("session_id");
    if (session_id.empty()) {
        return text_response(400, "session_id is required");
    }

    auto session = sessions_.find(session_id);
    if (!session) {
        return text_response(404, "Could not find session");
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[http] Invalid JSON from session " << session_id << ": "
                  << e.what() << "\n";
        return text_response(400, "Could not parse message");
    }

    // The stream may close before a slow tool call finishes; drop the reply then.
    std::weak_ptr<SseSession> weak = session;
    server_.handle_message(message, [weak](const nlohmann::json& response) {
        if (auto s = weak.lock()) {
            s->push(McpServer::serialize(response));
        }
    });

    return text_response(202, "Accepted");
}

} // namespace paragate
