#include "stdio.hpp"
#include "../util.hpp"
#include <string>

namespace paragate {

StdioTransport::StdioTransport(McpServer& server, BS::thread_pool& pool,
                               std::istream& in, std::ostream& out)
    : server_(server)
    , pool_(pool)
    , in_(in)
    , out_(out)
{}

void StdioTransport::write_message(const nlohmann::json& message) {
    std::string line = McpServer::serialize(message);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << line << '\n' << std::flush;
}

void StdioTransport::run() {
    std::cerr << "[stdio] Session started\n";

    std::string line;
    while (std::getline(in_, line)) {
        line = trim(line);
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[stdio] Invalid JSON: " << e.what() << "\n";
            write_message(McpServer::make_error(nullptr, rpc_error::ParseError, "Parse error"));
            continue;
        }

        server_.handle_message(message, [this](const nlohmann::json& response) {
            write_message(response);
        });
    }

    pool_.wait();
    std::cerr << "[stdio] Session ended\n";
}

} // namespace paragate
