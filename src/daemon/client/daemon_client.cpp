#include <toolhub/daemon/client/asio_transport.h>
#include <toolhub/daemon/client/daemon_client.h>
#include <toolhub/daemon/client/ipc_failure.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

namespace toolhub::daemon {

using boost::asio::awaitable;

Error remoteError(const ProtocolError& err) {
    ErrorCode code = ErrorCode::InternalError;
    switch (err.code) {
        case ProtocolErrorCode::BadRequest:
            code = ErrorCode::InvalidArgument;
            break;
        case ProtocolErrorCode::NotFound:
            code = ErrorCode::NotFound;
            break;
        case ProtocolErrorCode::AmbiguousTool:
            code = ErrorCode::InvalidArgument;
            break;
        case ProtocolErrorCode::ToolFailed:
        case ProtocolErrorCode::Internal:
            code = ErrorCode::InternalError;
            break;
    }
    return Error{code, std::format("{}: {}", protocolErrorCodeName(err.code), err.message)};
}

class DaemonClient::Impl {
public:
    explicit Impl(ClientConfig cfg) : config_(std::move(cfg)) {}

    AsioTransportAdapter transport() const {
        AsioTransportAdapter::Options opts;
        opts.socketPath = config_.socketPath;
        opts.connectTimeout = config_.connectTimeout;
        opts.requestTimeout = config_.requestTimeout;
        return AsioTransportAdapter(std::move(opts));
    }

    AsioTransportAdapter probeTransport() const {
        AsioTransportAdapter::Options opts;
        opts.socketPath = config_.socketPath;
        opts.connectTimeout = std::min(config_.connectTimeout, kProbeTimeout);
        opts.requestTimeout = kProbeTimeout;
        return AsioTransportAdapter(std::move(opts));
    }

    ClientConfig config_;
};

DaemonClient::DaemonClient(ClientConfig config)
    : pImpl(std::make_unique<Impl>(std::move(config))) {}

DaemonClient::~DaemonClient() = default;
DaemonClient::DaemonClient(DaemonClient&&) noexcept = default;
DaemonClient& DaemonClient::operator=(DaemonClient&&) noexcept = default;

const ClientConfig& DaemonClient::config() const noexcept {
    return pImpl->config_;
}

awaitable<Result<json>> DaemonClient::call(std::string_view method, json params) {
    Request req;
    req.id = generateRequestId();
    req.method = std::string(method);
    req.params = std::move(params);

    spdlog::debug("DaemonClient: {} -> {} ({})", req.method, pImpl->config_.socketPath.string(),
                  req.id);
    auto transport = pImpl->transport();
    auto res = co_await transport.send_request(req);
    if (!res) {
        co_return res.error();
    }

    auto& response = res.value();
    if (response.error) {
        spdlog::debug("DaemonClient: {} failed remotely: {}", req.method, response.error->message);
        co_return remoteError(*response.error);
    }
    co_return response.result.value_or(json(nullptr));
}

awaitable<Result<DaemonStatus>> DaemonClient::status() {
    auto res = co_await call(methods::DaemonStatus);
    if (!res) {
        co_return res.error();
    }
    try {
        co_return res.value().get<DaemonStatus>();
    } catch (const json::exception& e) {
        co_return makeIpcError(IpcFailureKind::Protocol,
                               std::format("Malformed status payload: {}", e.what()));
    }
}

awaitable<Result<void>> DaemonClient::stop() {
    auto res = co_await call(methods::DaemonStop);
    if (!res) {
        co_return res.error();
    }
    co_return Result<void>();
}

awaitable<Result<std::vector<ToolSummary>>> DaemonClient::listTools() {
    auto res = co_await call(methods::ToolList);
    if (!res) {
        co_return res.error();
    }
    try {
        const auto& payload = res.value();
        const auto& tools = payload.is_object() ? payload.at("tools") : payload;
        co_return tools.get<std::vector<ToolSummary>>();
    } catch (const json::exception& e) {
        co_return makeIpcError(IpcFailureKind::Protocol,
                               std::format("Malformed tool list: {}", e.what()));
    }
}

awaitable<Result<tools::ToolResponse>> DaemonClient::invokeTool(std::string_view tool, json args) {
    json params{{"tool", std::string(tool)},
                {"args", args.is_null() ? json::object() : std::move(args)}};
    auto res = co_await call(methods::ToolInvoke, std::move(params));
    if (!res) {
        co_return res.error();
    }
    co_return tools::ToolResponse::fromJson(res.value());
}

awaitable<Result<BridgeToolList>> DaemonClient::listBridgeTools() {
    auto res = co_await call(methods::BridgeList);
    if (!res) {
        co_return res.error();
    }
    if (res.value().value("isError", false)) {
        co_return Error{ErrorCode::NotSupported,
                        tools::ToolResponse::fromJson(res.value()).joinedText()};
    }
    try {
        BridgeToolList list;
        list.tools = res.value().at("tools").get<std::vector<BridgeToolInfo>>();
        list.toolCount = res.value().value("toolCount", list.tools.size());
        co_return list;
    } catch (const json::exception& e) {
        co_return makeIpcError(IpcFailureKind::Protocol,
                               std::format("Malformed bridge tool list: {}", e.what()));
    }
}

awaitable<Result<tools::ToolResponse>> DaemonClient::invokeBridgeTool(std::string_view remoteTool,
                                                                      json args) {
    json params{{"remoteTool", std::string(remoteTool)},
                {"args", args.is_null() ? json::object() : std::move(args)}};
    auto res = co_await call(methods::BridgeInvoke, std::move(params));
    if (!res) {
        co_return res.error();
    }
    co_return tools::ToolResponse::fromJson(res.value());
}

awaitable<bool> DaemonClient::isRunning() {
    auto transport = pImpl->probeTransport();
    auto res = co_await transport.probe();
    if (!res) {
        spdlog::debug("DaemonClient: probe of {} failed: {}", pImpl->config_.socketPath.string(),
                      res.error().message);
        co_return false;
    }
    co_return true;
}

} // namespace toolhub::daemon
