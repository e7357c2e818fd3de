#pragma once

#include <toolhub/config/config_helpers.h>
#include <toolhub/core/types.h>
#include <toolhub/daemon/client/daemon_launcher.h>
#include <toolhub/tools/tool_catalog.h>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace toolhub::tools {

enum class Runtime { Cli, Daemon, Mcp };
enum class Transport { Direct, Daemon, Bridge };
enum class InvocationOutcome { Completed, InfraError };

const char* to_string(Runtime runtime) noexcept;
const char* to_string(Transport transport) noexcept;
const char* to_string(InvocationOutcome outcome) noexcept;

struct InvokeOptions {
    Runtime runtime = Runtime::Cli;
    std::filesystem::path socketPath;
    std::filesystem::path workspaceRoot;
    std::chrono::milliseconds startupTimeout = config::kDefaultStartupTimeout;
    // Forwarded to an auto-started daemon as TOOLHUB_DAEMON_LOG_LEVEL
    std::optional<std::string> logLevel;
};

struct InvocationRecord {
    std::string toolName;
    Runtime runtime = Runtime::Cli;
    Transport transport = Transport::Direct;
    InvocationOutcome outcome = InvocationOutcome::Completed;
    std::chrono::milliseconds duration{0};
};

// Daemon operations the invoker needs, separated so routing can be tested without sockets
class IDaemonGateway {
public:
    virtual ~IDaemonGateway() = default;

    virtual boost::asio::awaitable<bool> isRunning(const std::filesystem::path& socketPath) = 0;
    virtual boost::asio::awaitable<Result<void>>
    ensureRunning(const daemon::LaunchOptions& options) = 0;
    virtual boost::asio::awaitable<Result<ToolResponse>>
    invokeTool(const std::filesystem::path& socketPath, const std::string& tool, json args) = 0;
    virtual boost::asio::awaitable<Result<ToolResponse>>
    invokeBridgeTool(const std::filesystem::path& socketPath, const std::string& remoteTool,
                     json args) = 0;
};

// Gateway backed by DaemonClient and DaemonLauncher
std::shared_ptr<IDaemonGateway> makeDaemonGateway();

// Resolves tool names against a catalog and runs them either in-process or inside the
// workspace daemon. Resolution and operation failures come back as error responses; the
// awaitable itself only throws for non-standard exceptions.
class ToolInvoker {
public:
    using Observer = std::function<void(const InvocationRecord&)>;

    explicit ToolInvoker(const ToolCatalog& catalog,
                         std::shared_ptr<IDaemonGateway> gateway = makeDaemonGateway());

    void setObserver(Observer observer) { observer_ = std::move(observer); }

    boost::asio::awaitable<ToolResponse> invoke(std::string_view toolName, json args,
                                                const InvokeOptions& opts);

    // Skips name resolution for callers that already hold the definition
    boost::asio::awaitable<ToolResponse> invokeDirect(const ToolDefinition& tool, json args,
                                                      const InvokeOptions& opts);

    [[nodiscard]] const ToolCatalog& catalog() const noexcept { return catalog_; }

private:
    boost::asio::awaitable<ToolResponse> invokeViaDaemon(const ToolDefinition& tool, json args,
                                                         const InvokeOptions& opts,
                                                         Transport transport);
    void record(const ToolDefinition& tool, const InvokeOptions& opts, Transport transport,
                InvocationOutcome outcome, std::chrono::steady_clock::time_point startedAt) const;

    const ToolCatalog& catalog_;
    std::shared_ptr<IDaemonGateway> gateway_;
    Observer observer_;
};

} // namespace toolhub::tools
