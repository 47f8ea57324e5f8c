#include <catch2/catch.hpp>
#include "registry.hpp"
#include "tools/para_tools.hpp"
#include "mock_process_runner.hpp"
#include <algorithm>

using namespace paragate;
using json = nlohmann::json;

static InvokeSettings test_settings() {
    InvokeSettings s;
    s.program = "/opt/para/bin/para";
    s.timeout = std::chrono::milliseconds(1500);
    s.environment["PARA_API_KEY"] = "secret";
    return s;
}

// ── Catalog ──────────────────────────────────────────────────────

TEST_CASE("build_para_registry: registers all fifteen tools in order", "[registry]") {
    MockProcessRunner runner;
    auto registry = build_para_registry(runner, test_settings());

    std::vector<std::string> expected = {
        "para_list", "para_read", "para_headings", "para_search", "para_agenda",
        "para_environment", "para_version", "para_ai_overview", "para_directory",
        "para_path", "para_create", "para_archive", "para_delete", "para_open",
        "para_reveal"};
    REQUIRE(registry.names() == expected);
    REQUIRE(registry.size() == 15);
}

TEST_CASE("ToolRegistry::tools_list: MCP shape", "[registry]") {
    MockProcessRunner runner;
    auto registry = build_para_registry(runner, test_settings());
    json list = registry.tools_list();

    REQUIRE(list.is_array());
    REQUIRE(list.size() == 15);
    for (const auto& entry : list) {
        REQUIRE(entry.contains("name"));
        REQUIRE_FALSE(entry["description"].get<std::string>().empty());
        REQUIRE(entry["inputSchema"]["type"] == "object");
    }
    REQUIRE(list[3]["inputSchema"]["required"] == json::array({"scope", "query"}));
}

TEST_CASE("ToolRegistry::register_tool: duplicate name throws", "[registry]") {
    MockProcessRunner runner;
    auto registry = build_para_registry(runner, test_settings());

    ToolDescriptor dup;
    dup.name = "para_version";
    dup.input_schema = {{"type", "object"}};
    dup.rule = MarshalRule::Bare;
    dup.subcommand = "version";
    REQUIRE_THROWS_AS(registry.register_tool(dup), DuplicateToolError);
    REQUIRE(registry.size() == 15);
}

TEST_CASE("ToolRegistry::register_tool: schema not matching rule throws", "[registry]") {
    MockProcessRunner runner;
    ToolRegistry registry(runner, test_settings());

    ToolDescriptor tool;
    tool.name = "para_search";
    tool.input_schema = {{"type", "object"}, {"properties", json::object()}};
    tool.rule = MarshalRule::Search;
    REQUIRE_THROWS_AS(registry.register_tool(tool), std::invalid_argument);
    REQUIRE(registry.find("para_search") == nullptr);
}

// ── Dispatch ─────────────────────────────────────────────────────

TEST_CASE("ToolRegistry::dispatch: create project end to end", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited(R"({"success": true})");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_create", {{"type", "project"}, {"name", "alpha"}});

    REQUIRE(result.kind() == ToolResult::Kind::Structured);
    REQUIRE(result.to_json() == json{{"success", true}});
    REQUIRE(runner.call_count() == 1);

    auto call = runner.last_call();
    REQUIRE(call.program == "/opt/para/bin/para");
    REQUIRE(call.args == std::vector<std::string>{"create", "project", "alpha", "--json"});
    REQUIRE(call.timeout == std::chrono::milliseconds(1500));
    REQUIRE(call.environment.at("PARA_API_KEY") == "secret");
}

TEST_CASE("ToolRegistry::dispatch: unknown tool", "[registry]") {
    MockProcessRunner runner;
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_teleport", json::object());
    REQUIRE(result.is_error());
    REQUIRE(result.error() == ErrorKind::UnknownTool);
    REQUIRE(result.message() == "Unknown tool: para_teleport");
    REQUIRE(runner.call_count() == 0);
}

TEST_CASE("ToolRegistry::dispatch: missing field never launches", "[registry]") {
    MockProcessRunner runner;
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_search", {{"scope", "project"}, {"query", "x"}});
    REQUIRE(result.error() == ErrorKind::MissingField);
    REQUIRE(runner.call_count() == 0);

    result = registry.dispatch("para_read", {{"type", "project"}});
    REQUIRE(result.error() == ErrorKind::MissingField);
    REQUIRE(result.message() == "Missing required parameter: name");
    REQUIRE(runner.call_count() == 0);
}

TEST_CASE("ToolRegistry::dispatch: nonzero exit reports stderr", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited("", 1, "Project 'alpha' not found\n");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_read", {{"type", "project"}, {"name", "alpha"}});
    REQUIRE(result.error() == ErrorKind::ExternalToolError);
    REQUIRE(result.message() == "Para command failed: Project 'alpha' not found");
    REQUIRE(result.to_json() == json{{"error", "Para command failed: Project 'alpha' not found"}});
}

TEST_CASE("ToolRegistry::dispatch: timeout and launch failure pass through", "[registry]") {
    MockProcessRunner runner;
    ProcessOutcome timed_out;
    timed_out.status = ProcessStatus::TimedOut;
    timed_out.duration = std::chrono::milliseconds(1500);
    ProcessOutcome missing;
    missing.status = ProcessStatus::LaunchFailed;
    missing.launch_error = "Program not found or not executable: para";
    runner.outcome_queue = {timed_out, missing};
    auto registry = build_para_registry(runner, test_settings());

    auto r1 = registry.dispatch("para_version", json::object());
    REQUIRE(r1.error() == ErrorKind::Timeout);
    auto r2 = registry.dispatch("para_version", json::object());
    REQUIRE(r2.error() == ErrorKind::LaunchError);
    REQUIRE(r2.message() == "Program not found or not executable: para");
}

TEST_CASE("ToolRegistry::dispatch: blank stdout is success", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited("\n");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_delete", {{"type", "area"}, {"name", "old"}});
    REQUIRE(result.to_json() == json{{"success", true}, {"returncode", 0}});
}

TEST_CASE("ToolRegistry::dispatch: non-JSON stdout falls back to raw", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited("para 2.1.0\n");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_version", json::object());
    REQUIRE(result.kind() == ToolResult::Kind::RawFallback);
    REQUIRE(result.to_json() == json{{"output", "para 2.1.0\n"}, {"raw", true}});
}

// ── Post-process hooks ───────────────────────────────────────────

TEST_CASE("para_open: adds journal path and note", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited(R"({"path": "/home/u/para/projects/alpha"})");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_open", {{"type", "project"}, {"name", "alpha"}});
    json doc = result.to_json();
    REQUIRE(doc["path"] == "/home/u/para/projects/alpha");
    REQUIRE(doc["journalPath"] == "/home/u/para/projects/alpha/journal.org");
    REQUIRE(doc["note"].get<std::string>().find("open the file") != std::string::npos);
}

TEST_CASE("para_reveal: adds note only", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited(R"({"path": "/p"})");
    auto registry = build_para_registry(runner, test_settings());

    json doc = registry.dispatch("para_reveal", {{"type", "area"}, {"name", "a"}}).to_json();
    REQUIRE(doc["path"] == "/p");
    REQUIRE_FALSE(doc.contains("journalPath"));
    REQUIRE(doc["note"].get<std::string>().find("reveal the folder") != std::string::npos);
}

TEST_CASE("para_reveal: note added to plain-text output too", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited("/home/u/para/areas/a\n");
    auto registry = build_para_registry(runner, test_settings());

    json doc = registry.dispatch("para_reveal", {{"type", "area"}, {"name", "a"}}).to_json();
    REQUIRE(doc["raw"] == true);
    REQUIRE(doc["output"] == "/home/u/para/areas/a\n");
    REQUIRE(doc["note"].get<std::string>().find("reveal the folder") != std::string::npos);
}

TEST_CASE("para_open: hook skipped on failure", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited("", 2, "");
    auto registry = build_para_registry(runner, test_settings());

    auto result = registry.dispatch("para_open", {{"type", "project"}, {"name", "alpha"}});
    REQUIRE(result.is_error());
    REQUIRE(result.message() == "Para command failed: exited with status 2");
}

TEST_CASE("ToolRegistry::dispatch: throwing hook becomes Internal error", "[registry]") {
    MockProcessRunner runner;
    runner.next_outcome = MockProcessRunner::exited(R"({"ok": true})");
    ToolRegistry registry(runner, test_settings());

    ToolDescriptor tool;
    tool.name = "explode";
    tool.input_schema = {{"type", "object"}};
    tool.rule = MarshalRule::Bare;
    tool.subcommand = "version";
    tool.post_process = [](ToolResult&) { throw std::runtime_error("boom"); };
    registry.register_tool(tool);

    auto result = registry.dispatch("explode", json::object());
    REQUIRE(result.error() == ErrorKind::Internal);
    REQUIRE(result.message() == "Internal error: boom");
}
