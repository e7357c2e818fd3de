#include <toolhub/daemon/components/RequestDispatcher.h>

#include <spdlog/spdlog.h>

#include <format>

#include <unistd.h>

namespace toolhub::daemon {

using boost::asio::awaitable;

namespace {

constexpr const char* kBridgeUnavailableTitle = "BRIDGE_UNAVAILABLE";
constexpr const char* kBridgeUnavailableDetail = "No IDE bridge is configured for this daemon.";

// Missing args are an empty object; anything but an object is rejected
std::optional<json> tool_args(const json& params) {
    auto it = params.find("args");
    if (it == params.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace

RequestDispatcher::RequestDispatcher(DaemonIdentity identity, const tools::ToolCatalog& catalog,
                                     StateComponent& state, ActivityRegistry& activity,
                                     std::shared_ptr<tools::IToolBridge> bridge)
    : identity_(std::move(identity)), catalog_(catalog), invoker_(catalog, nullptr),
      state_(state), activity_(activity), bridge_(std::move(bridge)) {}

DaemonStatus RequestDispatcher::status() const {
    DaemonStatus s;
    s.pid = static_cast<int64_t>(::getpid());
    s.socketPath = identity_.socketPath;
    s.logPath = identity_.logPath;
    s.startedAt = state_.startedAtIso;
    s.toolCount = catalog_.size();
    s.workspaceRoot = identity_.workspaceRoot;
    s.workspaceKey = identity_.workspaceKey;
    s.enabledWorkflows = identity_.enabledWorkflows;
    s.version = identity_.version;
    s.inFlightRequests = state_.inFlight.load(std::memory_order_relaxed);
    s.activeLeases = activity_.total();
    return s;
}

awaitable<Response> RequestDispatcher::dispatch(const json& message) {
    auto parsed = parseRequest(message);
    if (!parsed) {
        spdlog::debug("Rejecting malformed request: {}", parsed.error().message);
        co_return Response::failure(extractRequestId(message), ProtocolErrorCode::BadRequest,
                                    parsed.error().message);
    }
    const auto& req = parsed.value();
    if (req.version != PROTOCOL_VERSION) {
        spdlog::debug("Rejecting request {} with protocol version {}", req.id, req.version);
        co_return Response::failure(
            req.id, ProtocolErrorCode::BadRequest,
            std::format("Unsupported protocol version {} (expected {})", req.version,
                        PROTOCOL_VERSION));
    }

    std::string failure;
    try {
        if (req.method == methods::DaemonStatus) {
            co_return Response::success(req.id, json(status()));
        }
        if (req.method == methods::DaemonStop) {
            spdlog::info("Stop requested by client ({})", req.id);
            if (onStop_) {
                onStop_();
            }
            co_return Response::success(req.id, json{{"stopping", true}});
        }
        if (req.method == methods::ToolList) {
            co_return handleToolList(req);
        }
        if (req.method == methods::ToolInvoke) {
            co_return co_await handleToolInvoke(req);
        }
        if (req.method == methods::BridgeList) {
            co_return co_await handleBridgeList(req);
        }
        if (req.method == methods::BridgeInvoke) {
            co_return co_await handleBridgeInvoke(req);
        }
        spdlog::debug("Unknown method '{}' ({})", req.method, req.id);
        co_return Response::failure(req.id, ProtocolErrorCode::BadRequest,
                                    std::format("Unknown method: {}", req.method));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    spdlog::error("Request {} ({}) failed: {}", req.id, req.method, failure);
    co_return Response::failure(req.id, ProtocolErrorCode::Internal, failure);
}

Response RequestDispatcher::handleToolList(const Request& req) const {
    json tools = json::array();
    for (const auto& def : catalog_.tools()) {
        tools.push_back(json(ToolSummary{def.cliName, def.workflowId, def.description,
                                         def.stateful}));
    }
    return Response::success(req.id, std::move(tools));
}

awaitable<Response> RequestDispatcher::handleToolInvoke(const Request& req) {
    auto toolIt = req.params.find("tool");
    if (toolIt == req.params.end() || !toolIt->is_string() ||
        toolIt->get<std::string>().empty()) {
        co_return Response::failure(req.id, ProtocolErrorCode::BadRequest,
                                    "params.tool must be a non-empty string");
    }
    auto args = tool_args(req.params);
    if (!args) {
        co_return Response::failure(req.id, ProtocolErrorCode::BadRequest,
                                    "params.args must be an object");
    }

    const auto name = toolIt->get<std::string>();
    auto resolved = catalog_.resolve(name);
    if (resolved.status == tools::ResolveStatus::Ambiguous) {
        co_return Response::failure(req.id, ProtocolErrorCode::AmbiguousTool,
                                    std::format("Multiple tools match '{}'", name),
                                    json{{"candidates", resolved.candidates}});
    }
    if (!resolved.found() || !resolved.tool) {
        co_return Response::failure(req.id, ProtocolErrorCode::NotFound,
                                    std::format("Unknown tool '{}'", name));
    }

    tools::InvokeOptions opts;
    opts.runtime = tools::Runtime::Daemon;
    opts.socketPath = identity_.socketPath;
    opts.workspaceRoot = identity_.workspaceRoot;
    auto response = co_await invoker_.invokeDirect(*resolved.tool, std::move(*args), opts);
    co_return Response::success(req.id, response.toJson());
}

awaitable<Response> RequestDispatcher::handleBridgeList(const Request& req) {
    if (!bridge_) {
        co_return Response::success(
            req.id,
            tools::ToolResponse::error(kBridgeUnavailableTitle, kBridgeUnavailableDetail).toJson());
    }
    auto listed = co_await bridge_->listTools();
    if (!listed) {
        co_return Response::failure(req.id, ProtocolErrorCode::ToolFailed,
                                    listed.error().message);
    }
    json tools = json::array();
    for (const auto& t : listed.value()) {
        tools.push_back(json(BridgeToolInfo{t.name, t.description, t.inputSchema}));
    }
    co_return Response::success(req.id,
                                json{{"toolCount", listed.value().size()}, {"tools", tools}});
}

awaitable<Response> RequestDispatcher::handleBridgeInvoke(const Request& req) {
    auto remoteIt = req.params.find("remoteTool");
    if (remoteIt == req.params.end() || !remoteIt->is_string() ||
        remoteIt->get<std::string>().empty()) {
        co_return Response::failure(req.id, ProtocolErrorCode::BadRequest,
                                    "params.remoteTool must be a non-empty string");
    }
    auto args = tool_args(req.params);
    if (!args) {
        co_return Response::failure(req.id, ProtocolErrorCode::BadRequest,
                                    "params.args must be an object");
    }
    if (!bridge_) {
        co_return Response::success(
            req.id,
            tools::ToolResponse::error(kBridgeUnavailableTitle, kBridgeUnavailableDetail).toJson());
    }

    auto result = co_await bridge_->invokeTool(remoteIt->get<std::string>(), std::move(*args));
    if (!result) {
        co_return Response::failure(req.id, ProtocolErrorCode::ToolFailed,
                                    result.error().message);
    }
    co_return Response::success(req.id, result.value().toJson());
}

} // namespace toolhub::daemon
