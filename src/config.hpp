#pragma once
#include "registry.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paragate {

// Accepted ranges for numeric settings. Values outside are logged and the
// default is kept.
constexpr uint32_t kMaxTimeoutSeconds = 24 * 60 * 60;
constexpr uint32_t kMaxConcurrentCalls = 256;
constexpr uint32_t kMaxKeepaliveSeconds = 60 * 60;
constexpr uint32_t kMaxBodyBytes = 64 * 1024 * 1024;

struct HttpConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    uint32_t max_body = 65536;        // bytes per POST
    uint32_t keepalive_seconds = 15;  // SSE ": ping" interval

    // "host:port" for HttpServer
    std::string listen_addr() const;
};

struct Config {
    std::string program = "para";
    uint32_t timeout_seconds = 30;
    uint32_t max_concurrent_calls = 8;

    // Credential handed to the child under `credential_env` (when non-empty)
    std::string credential_env = "PARA_API_KEY";
    std::string credential;

    std::map<std::string, std::string> env;  // extra child variables
    std::vector<std::string> forward_env = {"PARA_HOME", "PARA_ARCHIVE"};

    std::string transport = "stdio";  // "stdio" or "http"
    HttpConfig http;

    // Load $PARAGATE_CONFIG or ~/.paragate/config.json + env vars
    static Config load();

    // Load a specific file + env vars. A missing or malformed file yields
    // the defaults. Never writes.
    static Config load_file(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Path load() reads from
    static std::string config_path();

    bool use_http() const { return transport == "http"; }

    // Program, timeout and child environment for the tool registry
    InvokeSettings invoke_settings() const;
};

} // namespace paragate
