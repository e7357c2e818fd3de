// Command-line front end: parsing, exit codes and in-process tool calls

#include <catch2/catch_test_macros.hpp>

#include "common/test_helpers_catch2.h"

#include <toolhub/cli/toolhub_cli.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using toolhub::cli::ToolhubCLI;
using toolhub::test::EnvGuard;

namespace {

// Captures std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    CoutCapture(const CoutCapture&) = delete;
    CoutCapture& operator=(const CoutCapture&) = delete;

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

int runCli(std::vector<std::string> args) {
    args.insert(args.begin(), "toolhub");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    ToolhubCLI cli;
    return cli.run(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST_CASE("Help and version exit cleanly", "[cli][catch2]") {
    CoutCapture capture;
    CHECK(runCli({"--help"}) == 0);
    CHECK(capture.str().find("call") != std::string::npos);
    CHECK(runCli({"--version"}) == 0);
}

TEST_CASE("Unknown commands and missing subcommands fail", "[cli][catch2]") {
    CHECK(runCli({"bogus"}) != 0);
    CHECK(runCli({}) != 0);
}

TEST_CASE("tools lists the builtin catalog", "[cli][catch2]") {
    CoutCapture capture;
    REQUIRE(runCli({"tools"}) == 0);
    auto text = capture.str();
    CHECK(text.find("doctor") != std::string::npos);
    CHECK(text.find("start-background-process") != std::string::npos);
    CHECK(text.find("[daemon]") != std::string::npos);
}

TEST_CASE("tools --json emits an array of summaries", "[cli][catch2]") {
    CoutCapture capture;
    REQUIRE(runCli({"tools", "--json"}) == 0);
    auto parsed = nlohmann::json::parse(capture.str());
    REQUIRE(parsed.is_array());
    CHECK(parsed.size() == 4);
}

TEST_CASE("call runs stateless tools in-process", "[cli][catch2]") {
    EnvGuard socket("TOOLHUB_SOCKET", std::string("/tmp/th-cli-unused.sock"));
    CoutCapture capture;
    REQUIRE(runCli({"call", "doctor"}) == 0);
    auto text = capture.str();
    CHECK(text.find("Runtime: cli") != std::string::npos);
    CHECK(text.find("Socket: /tmp/th-cli-unused.sock") != std::string::npos);
}

TEST_CASE("call rejects non-object arguments", "[cli][catch2]") {
    CHECK(runCli({"call", "doctor", "--args", "[1, 2]"}) == 1);
    CHECK(runCli({"call", "doctor", "--args", "{not json"}) == 1);
}

TEST_CASE("call reports unknown tools through the exit code", "[cli][catch2]") {
    CoutCapture capture;
    CHECK(runCli({"call", "no-such-tool"}) == 1);
    CHECK(capture.str().find("Error: Tool not found") != std::string::npos);
}

TEST_CASE("call --json prints the structured response", "[cli][catch2]") {
    CoutCapture capture;
    REQUIRE(runCli({"--json", "call", "doctor"}) == 0);
    auto parsed = nlohmann::json::parse(capture.str());
    CHECK_FALSE(parsed.value("isError", false));
    CHECK(parsed["content"][0]["type"] == "text");
}

TEST_CASE("daemon status exits non-zero when nothing is running", "[cli][daemon][catch2]") {
    EnvGuard socket("TOOLHUB_SOCKET", toolhub::test::make_socket_path("cli").string());

    {
        CoutCapture capture;
        CHECK(runCli({"daemon", "status"}) == 3);
        CHECK(capture.str().find("Daemon Status: Not running") != std::string::npos);
    }
    {
        CoutCapture capture;
        CHECK(runCli({"--json", "daemon", "status"}) == 3);
        auto parsed = nlohmann::json::parse(capture.str());
        CHECK(parsed["running"] == false);
    }
}
