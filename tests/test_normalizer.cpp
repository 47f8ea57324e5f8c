#include <catch2/catch.hpp>
#include "normalizer.hpp"

using namespace paragate;
using json = nlohmann::json;

TEST_CASE("normalize_output: JSON document is structured", "[normalizer]") {
    auto r = normalize_output(R"({"projects": ["alpha", "beta"], "count": 2})");
    REQUIRE(r.kind() == ToolResult::Kind::Structured);
    REQUIRE(r.value()["count"] == 2);
    REQUIRE(r.value()["projects"][1] == "beta");
}

TEST_CASE("normalize_output: top-level array and scalar stay structured", "[normalizer]") {
    REQUIRE(normalize_output("[1, 2, 3]").value().size() == 3);
    REQUIRE(normalize_output("\"2.1.0\"\n").value() == "2.1.0");
}

TEST_CASE("normalize_output: not json falls back to raw text", "[normalizer]") {
    auto r = normalize_output("not json");
    REQUIRE(r.kind() == ToolResult::Kind::RawFallback);
    REQUIRE_FALSE(r.is_error());
    REQUIRE(r.raw_text() == "not json");
    REQUIRE(r.to_json() == json{{"output", "not json"}, {"raw", true}});
}

TEST_CASE("normalize_output: trailing garbage is not JSON", "[normalizer]") {
    auto r = normalize_output("{\"a\": 1} warning: deprecated");
    REQUIRE(r.kind() == ToolResult::Kind::RawFallback);
}

TEST_CASE("normalize_outcome: failures map to error kinds", "[normalizer]") {
    ProcessOutcome o;
    o.status = ProcessStatus::Exited;
    o.exit_code = 3;
    o.stdout_text = R"({"partial": true})";
    o.stderr_text = "  boom \n";
    auto r = normalize_outcome(o);
    REQUIRE(r.error() == ErrorKind::ExternalToolError);
    REQUIRE(r.message() == "Para command failed: boom");

    o.status = ProcessStatus::TimedOut;
    o.duration = std::chrono::milliseconds(250);
    r = normalize_outcome(o);
    REQUIRE(r.error() == ErrorKind::Timeout);
    REQUIRE(r.message() == "Para command timed out after 250 ms");
}

TEST_CASE("normalize_outcome: clean exit with blank stdout", "[normalizer]") {
    ProcessOutcome o;
    o.stdout_text = "   \n";
    auto r = normalize_outcome(o);
    REQUIRE(r.kind() == ToolResult::Kind::Structured);
    REQUIRE(r.to_json() == json{{"success", true}, {"returncode", 0}});
}

TEST_CASE("ToolResult: error wire form", "[normalizer]") {
    auto r = ToolResult::failure(ErrorKind::LaunchError, "no such file");
    REQUIRE(r.is_error());
    REQUIRE(r.to_json() == json{{"error", "no such file"}});
    REQUIRE(std::string(error_kind_name(r.error())) == "LaunchError");
}
