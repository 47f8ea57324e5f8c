#include "process.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace paragate {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on one poll() wait; the deadline is re-checked after each.
constexpr std::chrono::milliseconds::rep kMaxPollSliceMs = 1000;

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// KEY=VALUE strings for the child: inherited environment with overrides
// replacing or adding entries.
std::vector<std::string> build_env_block(const Environment& overrides) {
    std::vector<std::string> block;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key) == 0) block.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        block.push_back(key + "=" + value);
    }
    return block;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

} // namespace

std::string resolve_program(const std::string& program, const std::string& search_path) {
    if (program.empty()) return {};
    if (program.find('/') != std::string::npos) {
        return is_executable_file(program) ? program : std::string{};
    }
    for (const auto& dir : split(search_path, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + program;
        if (is_executable_file(candidate)) return candidate;
    }
    return {};
}

ProcessOutcome PosixProcessRunner::run(const std::string& program,
                                       const std::vector<std::string>& args,
                                       std::chrono::milliseconds timeout,
                                       const Environment& overrides) {
    ProcessOutcome outcome;
    const auto start = Clock::now();

    std::string search_path;
    auto path_override = overrides.find("PATH");
    if (path_override != overrides.end()) {
        search_path = path_override->second;
    } else if (const char* p = std::getenv("PATH")) {
        search_path = p;
    }

    std::string resolved = resolve_program(program, search_path);
    if (resolved.empty()) {
        outcome.status = ProcessStatus::LaunchFailed;
        outcome.launch_error = "Program not found or not executable: " + program;
        return outcome;
    }

    // Everything the child needs is built before fork.
    std::vector<std::string> env_block = build_env_block(overrides);
    std::vector<char*> envp;
    envp.reserve(env_block.size() + 1);
    for (auto& entry : env_block) envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_store;
    argv_store.reserve(args.size() + 1);
    argv_store.push_back(program);
    argv_store.insert(argv_store.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1);
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    // Close-on-exec everywhere: a concurrent call forking on another thread
    // must not inherit our write ends. dup2 clears the flag on fds 1 and 2.
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        outcome.status = ProcessStatus::LaunchFailed;
        outcome.launch_error = std::string("Failed to create pipes: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return outcome;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.status = ProcessStatus::LaunchFailed;
        outcome.launch_error = std::string("Failed to fork process: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return outcome;
    }

    if (pid == 0) {
        // Child: own session/process group, detached from any terminal
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);
        ::execve(resolved.c_str(), argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    outcome.pid = pid;
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        outcome.status = ProcessStatus::LaunchFailed;
        outcome.launch_error = "Failed to execute " + program + ": " + std::strerror(exec_errno);
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - start);
        return outcome;
    }

    const auto deadline = start + timeout;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&outcome.stdout_text, &outcome.stderr_text};
    std::array<char, 4096> buffer;
    bool timed_out = false;

    while (fds[0] >= 0 || fds[1] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        int index_of[2] = {-1, -1};
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count].fd = fds[i];
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            index_of[count] = i;
            ++count;
        }

        const auto wait_ms = std::min<std::chrono::milliseconds::rep>(
            remaining.count(), kMaxPollSliceMs);
        int ret = ::poll(pfds, count, static_cast<int>(wait_ms));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;  // deadline re-checked at loop top

        for (nfds_t k = 0; k < count; ++k) {
            if ((pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            int i = index_of[k];
            ssize_t got = ::read(fds[i], buffer.data(), buffer.size());
            if (got > 0) {
                if (sinks[i]->size() < kMaxCaptureBytes) {
                    sinks[i]->append(buffer.data(), static_cast<size_t>(got));
                }
            } else if (got == 0 || errno != EINTR) {
                close_fd(fds[i]);
            }
        }
    }

    // Both streams are closed (or the deadline passed); wait for exit.
    int status = 0;
    bool reaped = false;
    while (!timed_out) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            reaped = true;  // already gone
            break;
        }
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        ::poll(nullptr, 0, 10);
    }

    if (timed_out) {
        kill_group(pid);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        outcome.status = ProcessStatus::TimedOut;
        outcome.exit_code = decode_wait_status(status);
    } else {
        outcome.status = ProcessStatus::Exited;
        outcome.exit_code = reaped ? decode_wait_status(status) : -1;
    }

    close_fd(fds[0]);
    close_fd(fds[1]);
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start);
    return outcome;
}

std::optional<ToolResult> outcome_error(const ProcessOutcome& outcome) {
    switch (outcome.status) {
        case ProcessStatus::TimedOut:
            return ToolResult::failure(ErrorKind::Timeout,
                "Para command timed out after " +
                std::to_string(outcome.duration.count()) + " ms");

        case ProcessStatus::LaunchFailed:
            return ToolResult::failure(ErrorKind::LaunchError, outcome.launch_error);

        case ProcessStatus::Exited: {
            if (outcome.exit_code == 0) return std::nullopt;
            std::string diagnostic = trim(outcome.stderr_text);
            if (diagnostic.empty()) {
                diagnostic = "exited with status " + std::to_string(outcome.exit_code);
            }
            return ToolResult::failure(ErrorKind::ExternalToolError,
                                       "Para command failed: " + diagnostic);
        }
    }
    return std::nullopt;
}

} // namespace paragate
