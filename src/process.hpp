#pragma once
#include "tool.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace paragate {

enum class ProcessStatus { Exited, TimedOut, LaunchFailed };

struct ProcessOutcome {
    ProcessStatus status = ProcessStatus::Exited;
    int exit_code = 0;  // 128 + signal number when terminated by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
    pid_t pid = -1;
    std::string launch_error;
};

// Variables set on top of the inherited environment for the child.
using Environment = std::map<std::string, std::string>;

// Abstract process launcher (injectable for testing)
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Run `program` with `args` (argv[1..]) to completion or until `timeout`
    // elapses. The child sees the current environment plus `overrides`.
    virtual ProcessOutcome run(const std::string& program,
                               const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout,
                               const Environment& overrides) = 0;
};

// fork/execve runner. The child gets its own session so a timeout can kill
// the whole process group; stdin is /dev/null; stdout and stderr are
// captured separately.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessOutcome run(const std::string& program,
                       const std::vector<std::string>& args,
                       std::chrono::milliseconds timeout,
                       const Environment& overrides) override;

    static constexpr size_t kMaxCaptureBytes = 8 * 1024 * 1024;
};

// Locate an executable. Names containing '/' are checked as given; bare
// names are searched in the ':'-separated `search_path`. Returns "" when
// nothing executable is found.
std::string resolve_program(const std::string& program, const std::string& search_path);

// Map a failed outcome to its error result (Timeout, LaunchError or
// ExternalToolError). Returns nullopt for a zero exit status.
std::optional<ToolResult> outcome_error(const ProcessOutcome& outcome);

} // namespace paragate
