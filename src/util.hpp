#pragma once
#include <string>
#include <vector>

namespace paragate {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate an unguessable session ID (32 hex chars, OpenSSL CSPRNG)
std::string generate_session_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Render an argument vector as a single shell-like line (for logging only)
std::string join_command(const std::string& program, const std::vector<std::string>& args);

// True if the environment variable is set to "true" (case-insensitive)
bool env_is_true(const char* name);

} // namespace paragate
