#pragma once

#include <toolhub/core/types.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>
#include <toolhub/tools/tool_response.h>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace toolhub::daemon {

struct ClientConfig {
    std::filesystem::path socketPath;
    std::chrono::milliseconds connectTimeout{1000};
    std::chrono::milliseconds requestTimeout{30000};
};

struct BridgeToolList {
    size_t toolCount = 0;
    std::vector<BridgeToolInfo> tools;
};

// Connect-request-disconnect client for the workspace daemon. Each call opens a fresh
// connection. Transport failures carry an IpcFailureKind prefix; error responses from the
// daemon become Error{code, "<WIRE_CODE>: message"}.
class DaemonClient {
public:
    static constexpr std::chrono::milliseconds kProbeTimeout{1000};

    explicit DaemonClient(ClientConfig config);
    ~DaemonClient();

    DaemonClient(const DaemonClient&) = delete;
    DaemonClient& operator=(const DaemonClient&) = delete;
    DaemonClient(DaemonClient&&) noexcept;
    DaemonClient& operator=(DaemonClient&&) noexcept;

    // Raw method call returning the response result payload
    boost::asio::awaitable<Result<json>> call(std::string_view method,
                                              json params = json::object());

    boost::asio::awaitable<Result<DaemonStatus>> status();
    boost::asio::awaitable<Result<void>> stop();
    boost::asio::awaitable<Result<std::vector<ToolSummary>>> listTools();
    boost::asio::awaitable<Result<tools::ToolResponse>> invokeTool(std::string_view tool,
                                                                   json args);
    boost::asio::awaitable<Result<BridgeToolList>> listBridgeTools();
    boost::asio::awaitable<Result<tools::ToolResponse>> invokeBridgeTool(std::string_view remoteTool,
                                                                         json args);

    // True when a connect succeeds within the probe timeout
    boost::asio::awaitable<bool> isRunning();

    [[nodiscard]] const ClientConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Error for a daemon-side error response
Error remoteError(const ProtocolError& err);

} // namespace toolhub::daemon
