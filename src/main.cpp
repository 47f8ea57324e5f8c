#include "config.hpp"
#include "mcp_server.hpp"
#include "process.hpp"
#include "registry.hpp"
#include "tools/para_tools.hpp"
#include "transports/http_server.hpp"
#include "transports/sse_transport.hpp"
#include "transports/stdio.hpp"
#include "util.hpp"
#include <BS_thread_pool.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: paragate [options]\n"
              << "\n"
              << "Serves the para command-line tool as MCP tools over stdio (default)\n"
              << "or HTTP with server-sent events.\n"
              << "\n"
              << "Options:\n"
              << "  --stdio              Serve newline-delimited JSON-RPC on stdin/stdout\n"
              << "  --http               Serve HTTP/SSE (GET /sse, POST /messages/)\n"
              << "  --port N             HTTP port (default: 8000)\n"
              << "  --program PATH       para executable (default: para)\n"
              << "  --timeout S          Per-call timeout in seconds (default: 30)\n"
              << "  --list-tools         Print the tool catalog as JSON and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  PARA_CLI_PATH        Path to the para executable\n"
              << "  PARAGATE_CONFIG      Config file (default: ~/.paragate/config.json)\n"
              << "  USE_HTTP             'true' selects the HTTP transport\n"
              << "  PORT                 HTTP port\n"
              << "  BIND_ALL_INTERFACES  If set, listen on 0.0.0.0 instead of 127.0.0.1\n"
              << "  PARA_HOME, PARA_ARCHIVE  Passed through to para\n";
}

// Positive whole number from a CLI argument; 0 on anything else.
static unsigned long parse_count(const char* s) {
    if (!s || !*s) return 0;
    char* end = nullptr;
    unsigned long v = std::strtoul(s, &end, 10);
    if (*end != '\0' || s[0] == '-') return 0;
    return v;
}

static void log_startup(const paragate::Config& config,
                        const paragate::ToolRegistry& registry) {
    std::string resolved = paragate::resolve_program(
        config.program, std::getenv("PATH") ? std::getenv("PATH") : "");
    std::cerr << "[gateway] para program: " << config.program;
    if (resolved.empty()) {
        std::cerr << " (not found, calls will fail to launch)";
    } else if (resolved != config.program) {
        std::cerr << " (" << resolved << ")";
    }
    std::cerr << "\n";

    for (const auto& name : config.forward_env) {
        const char* v = std::getenv(name.c_str());
        std::cerr << "[gateway] " << name << ": " << (v ? v : "(unset)") << "\n";
    }
    std::cerr << "[gateway] " << registry.size() << " tools registered, "
              << config.max_concurrent_calls << " concurrent calls, "
              << config.timeout_seconds << "s timeout\n";
}

static int run_http(const paragate::Config& config, paragate::McpServer& server) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    paragate::SseTransport transport(
        server, std::chrono::seconds(config.http.keepalive_seconds));
    paragate::HttpServer http(
        config.http.listen_addr(), config.http.max_body,
        [&transport](const paragate::HttpRequest& req) {
            return transport.handle_request(req);
        });

    std::string error;
    if (!http.start(error)) {
        std::cerr << "[http] " << error << "\n";
        return 1;
    }

    std::cerr << "[http] Listening on http://" << config.http.listen_addr()
              << " (SSE endpoint /sse, messages /messages/)\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[http] Shutting down.\n";
    transport.shutdown();
    http.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string transport;
    std::string program;
    unsigned long port = 0;
    unsigned long timeout = 0;
    bool list_tools = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--http") == 0) {
            transport = "http";
        } else if (std::strcmp(argv[i], "--stdio") == 0) {
            transport = "stdio";
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = parse_count(argv[++i]);
            if (port == 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--program") == 0 && i + 1 < argc) {
            program = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout = parse_count(argv[++i]);
            if (timeout == 0 || timeout > paragate::kMaxTimeoutSeconds) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--list-tools") == 0) {
            list_tools = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = paragate::Config::load();

    // Override config with CLI args
    if (!transport.empty()) config.transport = transport;
    if (!program.empty()) config.program = program;
    if (port != 0) config.http.port = static_cast<uint16_t>(port);
    if (timeout != 0) config.timeout_seconds = static_cast<uint32_t>(timeout);

    paragate::PosixProcessRunner runner;
    paragate::ToolRegistry registry =
        paragate::build_para_registry(runner, config.invoke_settings());

    if (list_tools) {
        std::cout << registry.tools_list().dump(2) << "\n";
        return 0;
    }

    log_startup(config, registry);

    BS::thread_pool pool(static_cast<BS::concurrency_t>(config.max_concurrent_calls));
    paragate::McpServer server(registry, pool);

    int rc = 0;
    if (config.use_http()) {
        rc = run_http(config, server);
    } else {
        paragate::StdioTransport stdio(server, pool);
        stdio.run();
    }

    // Queued calls reference the server; let them finish first
    pool.wait();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
