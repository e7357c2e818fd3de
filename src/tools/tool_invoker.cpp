#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/ipc_failure.h>
#include <toolhub/tools/tool_invoker.h>

#include <spdlog/spdlog.h>

#include <format>

namespace toolhub::tools {

using boost::asio::awaitable;

const char* to_string(Runtime runtime) noexcept {
    switch (runtime) {
        case Runtime::Cli:
            return "cli";
        case Runtime::Daemon:
            return "daemon";
        case Runtime::Mcp:
            return "mcp";
    }
    return "cli";
}

const char* to_string(Transport transport) noexcept {
    switch (transport) {
        case Transport::Direct:
            return "direct";
        case Transport::Daemon:
            return "daemon";
        case Transport::Bridge:
            return "bridge";
    }
    return "direct";
}

const char* to_string(InvocationOutcome outcome) noexcept {
    switch (outcome) {
        case InvocationOutcome::Completed:
            return "completed";
        case InvocationOutcome::InfraError:
            return "infra_error";
    }
    return "completed";
}

namespace {

class ClientDaemonGateway final : public IDaemonGateway {
public:
    awaitable<bool> isRunning(const std::filesystem::path& socketPath) override {
        daemon::DaemonClient client(daemon::ClientConfig{.socketPath = socketPath});
        co_return co_await client.isRunning();
    }

    awaitable<Result<void>> ensureRunning(const daemon::LaunchOptions& options) override {
        co_return co_await launcher_.ensureRunning(options);
    }

    awaitable<Result<ToolResponse>> invokeTool(const std::filesystem::path& socketPath,
                                               const std::string& tool, json args) override {
        daemon::DaemonClient client(daemon::ClientConfig{.socketPath = socketPath});
        co_return co_await client.invokeTool(tool, std::move(args));
    }

    awaitable<Result<ToolResponse>> invokeBridgeTool(const std::filesystem::path& socketPath,
                                                     const std::string& remoteTool,
                                                     json args) override {
        daemon::DaemonClient client(daemon::ClientConfig{.socketPath = socketPath});
        co_return co_await client.invokeBridgeTool(remoteTool, std::move(args));
    }

private:
    daemon::DaemonLauncher launcher_;
};

std::string ambiguity_detail(std::string_view toolName, const std::vector<std::string>& names) {
    std::string detail = std::format("Multiple tools match '{}'. Use one of:", toolName);
    for (const auto& name : names) {
        detail += "\n- " + name;
    }
    return detail;
}

} // namespace

std::shared_ptr<IDaemonGateway> makeDaemonGateway() {
    return std::make_shared<ClientDaemonGateway>();
}

ToolInvoker::ToolInvoker(const ToolCatalog& catalog, std::shared_ptr<IDaemonGateway> gateway)
    : catalog_(catalog), gateway_(std::move(gateway)) {}

void ToolInvoker::record(const ToolDefinition& tool, const InvokeOptions& opts,
                         Transport transport, InvocationOutcome outcome,
                         std::chrono::steady_clock::time_point startedAt) const {
    InvocationRecord rec;
    rec.toolName = tool.mcpName;
    rec.runtime = opts.runtime;
    rec.transport = transport;
    rec.outcome = outcome;
    rec.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt);
    spdlog::debug("Invocation {} runtime={} transport={} outcome={} duration={}ms", rec.toolName,
                  to_string(rec.runtime), to_string(rec.transport), to_string(rec.outcome),
                  rec.duration.count());
    if (observer_) {
        observer_(rec);
    }
}

awaitable<ToolResponse> ToolInvoker::invoke(std::string_view toolName, json args,
                                            const InvokeOptions& opts) {
    auto resolved = catalog_.resolve(toolName);
    if (resolved.status == ResolveStatus::Ambiguous) {
        co_return ToolResponse::error("Ambiguous tool name",
                                      ambiguity_detail(toolName, resolved.candidates));
    }
    if (!resolved.found() || !resolved.tool) {
        co_return ToolResponse::error(
            "Tool not found",
            std::format("Unknown tool '{}'. Run 'toolhub tools' to see available tools.",
                        toolName));
    }
    co_return co_await invokeDirect(*resolved.tool, std::move(args), opts);
}

awaitable<ToolResponse> ToolInvoker::invokeDirect(const ToolDefinition& tool, json args,
                                                  const InvokeOptions& opts) {
    if (opts.runtime == Runtime::Cli && tool.bridged()) {
        co_return co_await invokeViaDaemon(tool, std::move(args), opts, Transport::Bridge);
    }
    if (opts.runtime == Runtime::Cli && tool.stateful) {
        co_return co_await invokeViaDaemon(tool, std::move(args), opts, Transport::Daemon);
    }

    const auto startedAt = std::chrono::steady_clock::now();
    if (!tool.handler) {
        spdlog::error("[infra/tool-invoker] {} has no handler", tool.mcpName);
        record(tool, opts, Transport::Direct, InvocationOutcome::InfraError, startedAt);
        co_return ToolResponse::error("Tool execution failed",
                                      std::format("Tool '{}' has no handler", tool.cliName));
    }

    std::string failure;
    try {
        auto response = co_await tool.handler(std::move(args));
        record(tool, opts, Transport::Direct, InvocationOutcome::Completed, startedAt);
        co_return response;
    } catch (const std::exception& e) {
        failure = e.what();
    }
    spdlog::error("[infra/tool-invoker] direct tool handler failed for {}: {}", tool.mcpName,
                  failure);
    record(tool, opts, Transport::Direct, InvocationOutcome::InfraError, startedAt);
    co_return ToolResponse::error("Tool execution failed", failure);
}

awaitable<ToolResponse> ToolInvoker::invokeViaDaemon(const ToolDefinition& tool, json args,
                                                     const InvokeOptions& opts,
                                                     Transport transport) {
    const auto startedAt = std::chrono::steady_clock::now();
    const bool viaBridge = transport == Transport::Bridge;
    const std::string label = viaBridge ? "bridge" : "daemon/" + tool.mcpName;

    if (opts.socketPath.empty()) {
        spdlog::error("[infra/tool-invoker] {}: no socket path", label);
        record(tool, opts, transport, InvocationOutcome::InfraError, startedAt);
        co_return ToolResponse::error("Socket path required",
                                      "No socket path configured for daemon communication.");
    }

    if (!gateway_) {
        spdlog::error("[infra/tool-invoker] {}: no daemon gateway in this runtime", label);
        record(tool, opts, transport, InvocationOutcome::InfraError, startedAt);
        co_return ToolResponse::error("Daemon invocation failed",
                                      "Daemon routing is not available in this runtime.");
    }

    if (!co_await gateway_->isRunning(opts.socketPath)) {
        daemon::LaunchOptions launch;
        launch.socketPath = opts.socketPath;
        launch.workspaceRoot = opts.workspaceRoot;
        launch.startupTimeout = opts.startupTimeout;
        if (opts.logLevel) {
            launch.env[config::kEnvLogLevel] = *opts.logLevel;
        }
        auto started = co_await gateway_->ensureRunning(launch);
        if (!started) {
            spdlog::error("[infra/tool-invoker] {} daemon auto-start failed: {}", label,
                          started.error().message);
            record(tool, opts, transport, InvocationOutcome::InfraError, startedAt);
            co_return ToolResponse::error(
                "Daemon auto-start failed",
                std::format("{}\n\n{}", started.error().message, daemon::kManualStartHint));
        }
    }

    Result<ToolResponse> response = Error{ErrorCode::NotInitialized};
    if (viaBridge) {
        response = co_await gateway_->invokeBridgeTool(opts.socketPath, *tool.bridgeRemoteName,
                                                       std::move(args));
    } else {
        response = co_await gateway_->invokeTool(opts.socketPath, tool.cliName, std::move(args));
    }
    if (!response) {
        spdlog::error("[infra/tool-invoker] {} transport failed: {}", label,
                      response.error().message);
        record(tool, opts, transport, InvocationOutcome::InfraError, startedAt);
        co_return ToolResponse::error(viaBridge ? "Bridge invocation failed"
                                                : "Daemon invocation failed",
                                      std::string(daemon::stripIpcFailurePrefix(
                                          response.error().message)));
    }
    record(tool, opts, transport, InvocationOutcome::Completed, startedAt);
    co_return std::move(response).value();
}

} // namespace toolhub::tools
