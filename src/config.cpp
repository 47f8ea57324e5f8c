#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace paragate {

std::string HttpConfig::listen_addr() const {
    return host + ":" + std::to_string(port);
}

nlohmann::json Config::defaults_json() {
    return {
        {"program", "para"},
        {"timeout_seconds", 30},
        {"max_concurrent_calls", 8},
        {"credential_env", "PARA_API_KEY"},
        {"credential", ""},
        {"env", nlohmann::json::object()},
        {"forward_env", {"PARA_HOME", "PARA_ARCHIVE"}},
        {"transport", "stdio"},
        {"http", {
            {"host", "127.0.0.1"},
            {"port", 8000},
            {"max_body", 65536},
            {"keepalive_seconds", 15}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string Config::config_path() {
    if (const char* v = std::getenv("PARAGATE_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.paragate/config.json");
}

Config Config::load() {
    return load_file(config_path());
}

// Port from a string such as "8080"; false if not a valid TCP port.
static bool parse_port(const std::string& s, uint16_t& port) {
    if (s.empty() || s.size() > 5 ||
        s.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    int p = std::stoi(s);
    if (p <= 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// Unsigned setting within [min, max]; anything else leaves `out` untouched.
static void read_bounded(const nlohmann::json& obj, const char* key,
                         uint32_t min, uint32_t max, uint32_t& out,
                         const std::string& label) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_integer() || v.get<int64_t>() < min || v.get<int64_t>() > max) {
        std::cerr << "[config] Ignoring " << label << " " << v.dump()
                  << " (expected " << min << ".." << max << ")\n";
        return;
    }
    out = v.get<uint32_t>();
}

Config Config::load_file(const std::string& path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (original.is_object()) {
                j = merge_defaults(original, defaults_json());
            } else {
                std::cerr << "[config] " << path << " is not a JSON object, using defaults\n";
                j = defaults_json();
            }
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Malformed " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
    }

    // Parse JSON into Config struct
    if (j.contains("program") && j["program"].is_string())
        cfg.program = j["program"].get<std::string>();
    read_bounded(j, "timeout_seconds", 1, kMaxTimeoutSeconds,
                 cfg.timeout_seconds, "timeout_seconds");
    read_bounded(j, "max_concurrent_calls", 1, kMaxConcurrentCalls,
                 cfg.max_concurrent_calls, "max_concurrent_calls");
    if (j.contains("credential_env") && j["credential_env"].is_string())
        cfg.credential_env = j["credential_env"].get<std::string>();
    if (j.contains("credential") && j["credential"].is_string())
        cfg.credential = j["credential"].get<std::string>();
    if (j.contains("transport") && j["transport"].is_string())
        cfg.transport = to_lower(j["transport"].get<std::string>());

    if (j.contains("env") && j["env"].is_object()) {
        for (auto& [name, value] : j["env"].items()) {
            if (value.is_string())
                cfg.env[name] = value.get<std::string>();
        }
    }

    if (j.contains("forward_env") && j["forward_env"].is_array()) {
        cfg.forward_env.clear();
        for (const auto& name : j["forward_env"]) {
            if (name.is_string())
                cfg.forward_env.push_back(name.get<std::string>());
        }
    }

    if (j.contains("http") && j["http"].is_object()) {
        auto& h = j["http"];
        if (h.contains("host") && h["host"].is_string())
            cfg.http.host = h["host"].get<std::string>();
        if (h.contains("port") && h["port"].is_number_unsigned()) {
            auto p = h["port"].get<uint32_t>();
            if (p > 0 && p <= 65535)
                cfg.http.port = static_cast<uint16_t>(p);
            else
                std::cerr << "[config] Ignoring out-of-range http.port " << p << "\n";
        }
        read_bounded(h, "max_body", 1, kMaxBodyBytes,
                     cfg.http.max_body, "http.max_body");
        read_bounded(h, "keepalive_seconds", 1, kMaxKeepaliveSeconds,
                     cfg.http.keepalive_seconds, "http.keepalive_seconds");
    }

    if (cfg.transport != "stdio" && cfg.transport != "http") {
        std::cerr << "[config] Unknown transport '" << cfg.transport
                  << "', using stdio\n";
        cfg.transport = "stdio";
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("PARA_CLI_PATH")) {
        if (*v) cfg.program = v;
    }
    if (env_is_true("USE_HTTP"))
        cfg.transport = "http";
    if (const char* v = std::getenv("PORT")) {
        if (!parse_port(v, cfg.http.port))
            std::cerr << "[config] Ignoring invalid PORT '" << v << "'\n";
    }
    if (std::getenv("BIND_ALL_INTERFACES"))
        cfg.http.host = "0.0.0.0";

    return cfg;
}

InvokeSettings Config::invoke_settings() const {
    InvokeSettings settings;
    settings.program = program;
    settings.timeout = std::chrono::seconds(timeout_seconds);
    settings.environment = env;
    if (!credential.empty() && !credential_env.empty())
        settings.environment[credential_env] = credential;
    return settings;
}

} // namespace paragate
