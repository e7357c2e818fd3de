#pragma once

#include <toolhub/daemon/components/ActivityRegistry.h>
#include <toolhub/daemon/components/StateComponent.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>
#include <toolhub/tools/tool_bridge.h>
#include <toolhub/tools/tool_invoker.h>

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhub::daemon {

// Static facts reported by daemon.status
struct DaemonIdentity {
    std::string socketPath;
    std::optional<std::string> logPath;
    std::string workspaceRoot;
    std::string workspaceKey;
    std::vector<std::string> enabledWorkflows;
    std::string version;
};

// Maps one decoded request onto exactly one response. Never throws: failures inside a
// handler become INTERNAL responses.
class RequestDispatcher {
public:
    RequestDispatcher(DaemonIdentity identity, const tools::ToolCatalog& catalog,
                      StateComponent& state, ActivityRegistry& activity,
                      std::shared_ptr<tools::IToolBridge> bridge = nullptr);

    // Called when daemon.stop has been accepted; the response is written after this returns
    void setStopHandler(std::function<void()> handler) { onStop_ = std::move(handler); }

    boost::asio::awaitable<Response> dispatch(const json& message);

    DaemonStatus status() const;

private:
    boost::asio::awaitable<Response> handleToolInvoke(const Request& req);
    boost::asio::awaitable<Response> handleBridgeList(const Request& req);
    boost::asio::awaitable<Response> handleBridgeInvoke(const Request& req);
    Response handleToolList(const Request& req) const;

    DaemonIdentity identity_;
    const tools::ToolCatalog& catalog_;
    tools::ToolInvoker invoker_;
    StateComponent& state_;
    ActivityRegistry& activity_;
    std::shared_ptr<tools::IToolBridge> bridge_;
    std::function<void()> onStop_;
};

} // namespace toolhub::daemon
