#include <catch2/catch.hpp>
#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace paragate;
using namespace std::chrono_literals;

// Helper: create a temp directory and return its path
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "paragate_proc_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// Helper: write an executable shell script
static std::string write_script(const std::string& dir, const std::string& name,
                                const std::string& body) {
    std::string path = dir + "/" + name;
    {
        std::ofstream f(path);
        f << "#!/bin/sh\n" << body;
    }
    ::chmod(path.c_str(), 0755);
    return path;
}

TEST_CASE("PosixProcessRunner: captures stdout and passes arguments", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto script = write_script(dir, "echo_args", "printf '%s\\n' \"$@\"\n");

    PosixProcessRunner runner;
    auto out = runner.run(script, {"create", "project", "two words", "--json"}, 5000ms, {});

    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.exit_code == 0);
    REQUIRE(out.stdout_text == "create\nproject\ntwo words\n--json\n");
    REQUIRE(out.stderr_text.empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("PosixProcessRunner: nonzero exit keeps stderr", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto script = write_script(dir, "fail", "echo partial\necho 'Area not found' >&2\nexit 3\n");

    PosixProcessRunner runner;
    auto out = runner.run(script, {}, 5000ms, {});

    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.exit_code == 3);
    REQUIRE(out.stdout_text == "partial\n");
    REQUIRE(out.stderr_text == "Area not found\n");

    auto err = outcome_error(out);
    REQUIRE(err.has_value());
    REQUIRE(err->error() == ErrorKind::ExternalToolError);
    REQUIRE(err->message() == "Para command failed: Area not found");

    std::filesystem::remove_all(dir);
}

TEST_CASE("PosixProcessRunner: child sees inherited and overridden environment", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto script = write_script(dir, "env",
        "printf '%s|%s' \"$PARAGATE_TEST_INHERITED\" \"$PARA_API_KEY\"\n");

    setenv("PARAGATE_TEST_INHERITED", "from-parent", 1);
    PosixProcessRunner runner;
    auto out = runner.run(script, {}, 5000ms, {{"PARA_API_KEY", "k-123"}});
    unsetenv("PARAGATE_TEST_INHERITED");

    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.stdout_text == "from-parent|k-123");

    std::filesystem::remove_all(dir);
}

TEST_CASE("PosixProcessRunner: timeout kills the process", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto script = write_script(dir, "slow", "exec sleep 5\n");

    PosixProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto out = runner.run(script, {}, 300ms, {});
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(out.status == ProcessStatus::TimedOut);
    REQUIRE(elapsed < 3s);
    REQUIRE(out.pid > 0);
    // Reaped: no such process remains
    errno = 0;
    REQUIRE(::kill(out.pid, 0) == -1);
    REQUIRE(errno == ESRCH);

    auto err = outcome_error(out);
    REQUIRE(err.has_value());
    REQUIRE(err->error() == ErrorKind::Timeout);

    std::filesystem::remove_all(dir);
}

TEST_CASE("PosixProcessRunner: very long timeout still waits normally", "[process]") {
    PosixProcessRunner runner;
    // Longer than poll() can express in one call
    auto out = runner.run("/bin/sh", {"-c", "sleep 0.2; echo done"},
                          std::chrono::hours(24 * 60), {});
    REQUIRE(out.status == ProcessStatus::Exited);
    REQUIRE(out.stdout_text == "done\n");
}

TEST_CASE("PosixProcessRunner: slow calls do not hold up quick ones", "[process]") {
    PosixProcessRunner runner;
    std::atomic<bool> stop{false};

    // Keep children that outlive the quick calls forking on other threads
    std::vector<std::thread> slow;
    for (int i = 0; i < 3; ++i) {
        slow.emplace_back([&runner, &stop]() {
            while (!stop.load()) {
                runner.run("/bin/sleep", {"2"}, 5000ms, {});
            }
        });
    }

    std::vector<std::thread> quick;
    std::atomic<int> failures{0};
    std::atomic<long long> worst_ms{0};
    for (int i = 0; i < 3; ++i) {
        quick.emplace_back([&runner, &failures, &worst_ms]() {
            for (int n = 0; n < 100; ++n) {
                auto out = runner.run("/bin/sh", {"-c", "exit 0"}, 1500ms, {});
                if (out.status != ProcessStatus::Exited || out.exit_code != 0) {
                    failures.fetch_add(1);
                }
                long long ms = out.duration.count();
                long long prev = worst_ms.load();
                while (ms > prev && !worst_ms.compare_exchange_weak(prev, ms)) {}
            }
        });
    }
    for (auto& t : quick) t.join();
    stop.store(true);
    for (auto& t : slow) t.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(worst_ms.load() < 1000);
}

TEST_CASE("PosixProcessRunner: missing program is a launch failure", "[process]") {
    PosixProcessRunner runner;
    auto out = runner.run("/nonexistent/para", {"version"}, 1000ms, {});
    REQUIRE(out.status == ProcessStatus::LaunchFailed);
    REQUIRE(out.launch_error.find("/nonexistent/para") != std::string::npos);

    auto err = outcome_error(out);
    REQUIRE(err.has_value());
    REQUIRE(err->error() == ErrorKind::LaunchError);
}

TEST_CASE("PosixProcessRunner: non-executable file is a launch failure", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/plain";
    { std::ofstream f(path); f << "not a program\n"; }
    ::chmod(path.c_str(), 0644);

    PosixProcessRunner runner;
    auto out = runner.run(path, {}, 1000ms, {});
    REQUIRE(out.status == ProcessStatus::LaunchFailed);

    std::filesystem::remove_all(dir);
}

TEST_CASE("PosixProcessRunner: exec failure is reported, not an exit code", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/badinterp";
    { std::ofstream f(path); f << "#!/nonexistent/interpreter\n"; }
    ::chmod(path.c_str(), 0755);

    PosixProcessRunner runner;
    auto out = runner.run(path, {}, 1000ms, {});
    REQUIRE(out.status == ProcessStatus::LaunchFailed);
    REQUIRE(out.launch_error.rfind("Failed to execute", 0) == 0);

    std::filesystem::remove_all(dir);
}

TEST_CASE("resolve_program: searches the given path", "[process]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto script = write_script(dir, "para", "exit 0\n");

    REQUIRE(resolve_program("para", "/nonexistent:" + dir) == script);
    REQUIRE(resolve_program("para", "/nonexistent").empty());
    REQUIRE(resolve_program(script, "") == script);
    REQUIRE(resolve_program("", dir).empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("outcome_error: clean exit is not an error", "[process]") {
    ProcessOutcome out;
    out.status = ProcessStatus::Exited;
    out.exit_code = 0;
    REQUIRE_FALSE(outcome_error(out).has_value());
}
