// Request/response envelope encoding and strict request decoding

#include <catch2/catch_test_macros.hpp>

#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>

#include <set>

using namespace toolhub;
using namespace toolhub::daemon;

TEST_CASE("parseRequest accepts a well-formed envelope", "[ipc][protocol][catch2]") {
    json j{{"version", 1}, {"id", "r1"}, {"method", "tool.invoke"},
           {"params", {{"tool", "doctor"}}}};
    auto req = parseRequest(j);
    REQUIRE(req);
    CHECK(req.value().version == 1);
    CHECK(req.value().id == "r1");
    CHECK(req.value().method == "tool.invoke");
    CHECK(req.value().params["tool"] == "doctor");
}

TEST_CASE("parseRequest defaults missing params to an empty object", "[ipc][protocol][catch2]") {
    auto req = parseRequest(json{{"version", 1}, {"id", "r2"}, {"method", "daemon.status"}});
    REQUIRE(req);
    CHECK(req.value().params.is_object());
    CHECK(req.value().params.empty());
}

TEST_CASE("parseRequest keeps unsupported versions for the dispatcher to reject",
          "[ipc][protocol][catch2]") {
    auto req = parseRequest(json{{"version", 2}, {"id", "r3"}, {"method", "daemon.status"}});
    REQUIRE(req);
    CHECK(req.value().version == 2);
}

TEST_CASE("parseRequest rejects malformed envelopes", "[ipc][protocol][catch2]") {
    CHECK_FALSE(parseRequest(json::array()));
    CHECK_FALSE(parseRequest(json{{"id", "x"}, {"method", "m"}}));
    CHECK_FALSE(parseRequest(json{{"version", "1"}, {"id", "x"}, {"method", "m"}}));
    CHECK_FALSE(parseRequest(json{{"version", 1}, {"method", "m"}}));
    CHECK_FALSE(parseRequest(json{{"version", 1}, {"id", "x"}}));
    CHECK_FALSE(parseRequest(json{{"version", 1}, {"id", "x"}, {"method", "m"}, {"params", 3}}));
}

TEST_CASE("extractRequestId accepts string and integer ids", "[ipc][protocol][catch2]") {
    CHECK(extractRequestId(json{{"id", "abc"}}) == "abc");
    CHECK(extractRequestId(json{{"id", 42}}) == "42");
    CHECK(extractRequestId(json{{"id", true}}).empty());
    CHECK(extractRequestId(json("no")).empty());
}

TEST_CASE("Error responses carry the wire code, message and data", "[ipc][protocol][catch2]") {
    auto res = Response::failure("r9", ProtocolErrorCode::AmbiguousTool, "Multiple tools match",
                                 json{{"candidates", {"a", "b"}}});
    auto j = toJson(res);
    CHECK(j["version"] == PROTOCOL_VERSION);
    CHECK(j["id"] == "r9");
    CHECK(j["error"]["code"] == "AMBIGUOUS_TOOL");
    CHECK(j["error"]["data"]["candidates"].size() == 2);
    CHECK_FALSE(j.contains("result"));

    auto parsed = parseResponse(j);
    REQUIRE(parsed);
    REQUIRE(parsed.value().error);
    CHECK(parsed.value().error->code == ProtocolErrorCode::AmbiguousTool);
    CHECK(parsed.value().error->message == "Multiple tools match");
}

TEST_CASE("parseResponse requires a result or an error", "[ipc][protocol][catch2]") {
    CHECK_FALSE(parseResponse(json{{"version", 1}, {"id", "x"}}));
    auto ok = parseResponse(json{{"version", 1}, {"id", "x"}, {"result", nullptr}});
    REQUIRE(ok);
    CHECK(ok.value().ok());
}

TEST_CASE("Unknown wire error codes decode as INTERNAL", "[ipc][protocol][catch2]") {
    auto parsed = parseResponse(
        json{{"version", 1}, {"id", "x"}, {"error", {{"code", "WHAT"}, {"message", "m"}}}});
    REQUIRE(parsed);
    CHECK(parsed.value().error->code == ProtocolErrorCode::Internal);
}

TEST_CASE("parseResponse rejects mistyped fields as invalid data", "[ipc][protocol][catch2]") {
    auto badVersion = parseResponse(json{{"version", "1"}, {"id", "x"}, {"result", nullptr}});
    REQUIRE_FALSE(badVersion);
    CHECK(badVersion.error().code == ErrorCode::InvalidData);

    auto badCode = parseResponse(
        json{{"version", 1}, {"id", "x"}, {"error", {{"code", 7}, {"message", "m"}}}});
    REQUIRE_FALSE(badCode);
    CHECK(badCode.error().code == ErrorCode::InvalidData);

    auto badMessage = parseResponse(
        json{{"version", 1}, {"id", "x"}, {"error", {{"code", "NOT_FOUND"}, {"message", 42}}}});
    REQUIRE_FALSE(badMessage);
    CHECK(badMessage.error().code == ErrorCode::InvalidData);
}

TEST_CASE("remoteError maps wire codes onto local error codes", "[ipc][protocol][catch2]") {
    auto notFound = remoteError(ProtocolError{ProtocolErrorCode::NotFound, "Unknown tool 'x'"});
    CHECK(notFound.code == ErrorCode::NotFound);
    CHECK(notFound.message == "NOT_FOUND: Unknown tool 'x'");

    CHECK(remoteError(ProtocolError{ProtocolErrorCode::BadRequest, "m"}).code ==
          ErrorCode::InvalidArgument);
    CHECK(remoteError(ProtocolError{ProtocolErrorCode::AmbiguousTool, "m"}).code ==
          ErrorCode::InvalidArgument);
    CHECK(remoteError(ProtocolError{ProtocolErrorCode::Internal, "m"}).code ==
          ErrorCode::InternalError);
}

TEST_CASE("DaemonStatus survives a JSON round trip", "[ipc][protocol][catch2]") {
    DaemonStatus s;
    s.pid = 1234;
    s.socketPath = "/tmp/x.sock";
    s.logPath = "/tmp/x.log";
    s.toolCount = 4;
    s.enabledWorkflows = {"background", "diagnostics"};
    auto back = json(s).get<DaemonStatus>();
    CHECK(back.pid == 1234);
    CHECK(back.logPath == std::optional<std::string>("/tmp/x.log"));
    CHECK(back.enabledWorkflows == s.enabledWorkflows);
}

TEST_CASE("generateRequestId yields distinct ids", "[ipc][protocol][catch2]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(generateRequestId());
    }
    CHECK(ids.size() == 100);
}
