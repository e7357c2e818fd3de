// Classification prefixes on transport errors

#include <catch2/catch_test_macros.hpp>

#include <toolhub/daemon/client/ipc_failure.h>

using namespace toolhub;
using namespace toolhub::daemon;

TEST_CASE("IPC failures round-trip through the message prefix", "[ipc][failure][catch2]") {
    auto err = makeIpcError(IpcFailureKind::Refused, "connect failed");
    CHECK(err.code == ErrorCode::NetworkError);
    CHECK(err.message == "[ipc:refused] connect failed");
    CHECK(parseIpcFailureKind(err.message) == IpcFailureKind::Refused);
    CHECK(stripIpcFailurePrefix(err.message) == "connect failed");
}

TEST_CASE("Timeout and protocol failures use dedicated error codes", "[ipc][failure][catch2]") {
    CHECK(makeIpcError(IpcFailureKind::Timeout, "t").code == ErrorCode::Timeout);
    CHECK(makeIpcError(IpcFailureKind::Protocol, "p").code == ErrorCode::InvalidData);
}

TEST_CASE("Only missing sockets and refusals mean the daemon is not running",
          "[ipc][failure][catch2]") {
    CHECK(isDaemonNotRunning(makeIpcError(IpcFailureKind::SocketMissing, "x")));
    CHECK(isDaemonNotRunning(makeIpcError(IpcFailureKind::Refused, "x")));
    CHECK_FALSE(isDaemonNotRunning(makeIpcError(IpcFailureKind::Timeout, "x")));
    CHECK_FALSE(isDaemonNotRunning(Error{ErrorCode::NetworkError, "plain"}));
}

TEST_CASE("Messages without a known prefix are left untouched", "[ipc][failure][catch2]") {
    CHECK_FALSE(parseIpcFailureKind("[ipc:bogus] x"));
    CHECK(stripIpcFailurePrefix("[ipc:bogus] x") == "[ipc:bogus] x");
    CHECK(stripIpcFailurePrefix("plain") == "plain");
}
