#include <toolhub/daemon/ipc/ipc_protocol.h>

#include <unistd.h>
#include <atomic>
#include <chrono>
#include <format>

namespace toolhub::daemon {

const char* protocolErrorCodeName(ProtocolErrorCode code) noexcept {
    switch (code) {
        case ProtocolErrorCode::BadRequest:
            return "BAD_REQUEST";
        case ProtocolErrorCode::NotFound:
            return "NOT_FOUND";
        case ProtocolErrorCode::AmbiguousTool:
            return "AMBIGUOUS_TOOL";
        case ProtocolErrorCode::ToolFailed:
            return "TOOL_FAILED";
        case ProtocolErrorCode::Internal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

std::optional<ProtocolErrorCode> parseProtocolErrorCode(std::string_view name) noexcept {
    if (name == "BAD_REQUEST")
        return ProtocolErrorCode::BadRequest;
    if (name == "NOT_FOUND")
        return ProtocolErrorCode::NotFound;
    if (name == "AMBIGUOUS_TOOL")
        return ProtocolErrorCode::AmbiguousTool;
    if (name == "TOOL_FAILED")
        return ProtocolErrorCode::ToolFailed;
    if (name == "INTERNAL")
        return ProtocolErrorCode::Internal;
    return std::nullopt;
}

Response Response::success(std::string id, json result) {
    Response res;
    res.id = std::move(id);
    res.result = std::move(result);
    return res;
}

Response Response::failure(std::string id, ProtocolErrorCode code, std::string message,
                           std::optional<json> data) {
    Response res;
    res.id = std::move(id);
    res.error = ProtocolError{code, std::move(message), std::move(data)};
    return res;
}

json toJson(const Request& req) {
    return json{
        {"version", req.version}, {"id", req.id}, {"method", req.method}, {"params", req.params}};
}

json toJson(const Response& res) {
    json j{{"version", res.version}, {"id", res.id}};
    if (res.error) {
        json err{{"code", protocolErrorCodeName(res.error->code)},
                 {"message", res.error->message}};
        if (res.error->data) {
            err["data"] = *res.error->data;
        }
        j["error"] = std::move(err);
    } else {
        j["result"] = res.result.value_or(json(nullptr));
    }
    return j;
}

std::string extractRequestId(const json& j) {
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find("id");
    if (it == j.end()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<int64_t>());
    }
    return {};
}

Result<Request> parseRequest(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Request must be a JSON object"};
    }

    Request req;
    auto version = j.find("version");
    if (version == j.end() || !version->is_number_integer()) {
        return Error{ErrorCode::InvalidData, "Missing protocol version"};
    }
    req.version = version->get<int>();

    req.id = extractRequestId(j);
    if (req.id.empty()) {
        return Error{ErrorCode::InvalidData, "Missing request id"};
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        return Error{ErrorCode::InvalidData, "Missing method"};
    }
    req.method = method->get<std::string>();

    auto params = j.find("params");
    if (params != j.end() && !params->is_null()) {
        if (!params->is_object()) {
            return Error{ErrorCode::InvalidData, "params must be an object"};
        }
        req.params = *params;
    }
    return req;
}

Result<Response> parseResponse(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Response must be a JSON object"};
    }

    Response res;
    if (auto version = j.find("version"); version != j.end()) {
        if (!version->is_number_integer()) {
            return Error{ErrorCode::InvalidData, "Response version must be an integer"};
        }
        res.version = version->get<int>();
    }
    res.id = extractRequestId(j);

    auto err = j.find("error");
    if (err != j.end() && !err->is_null()) {
        if (!err->is_object()) {
            return Error{ErrorCode::InvalidData, "Malformed error object"};
        }
        ProtocolError pe;
        std::string code;
        if (auto c = err->find("code"); c != err->end()) {
            if (!c->is_string()) {
                return Error{ErrorCode::InvalidData, "Error code must be a string"};
            }
            code = c->get<std::string>();
        }
        pe.code = parseProtocolErrorCode(code).value_or(ProtocolErrorCode::Internal);
        if (auto m = err->find("message"); m != err->end()) {
            if (!m->is_string()) {
                return Error{ErrorCode::InvalidData, "Error message must be a string"};
            }
            pe.message = m->get<std::string>();
        }
        if (auto data = err->find("data"); data != err->end()) {
            pe.data = *data;
        }
        res.error = std::move(pe);
        return res;
    }

    auto result = j.find("result");
    if (result == j.end()) {
        return Error{ErrorCode::InvalidData, "Response carries neither result nor error"};
    }
    res.result = *result;
    return res;
}

std::string generateRequestId() {
    static std::atomic<uint64_t> counter{0};
    const auto now = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    return std::format("{}-{}-{}", static_cast<long>(::getpid()), now,
                       counter.fetch_add(1, std::memory_order_relaxed));
}

void to_json(json& j, const DaemonStatus& s) {
    j = json{{"pid", s.pid},
             {"socketPath", s.socketPath},
             {"startedAt", s.startedAt},
             {"toolCount", s.toolCount},
             {"workspaceRoot", s.workspaceRoot},
             {"workspaceKey", s.workspaceKey},
             {"enabledWorkflows", s.enabledWorkflows},
             {"version", s.version},
             {"inFlightRequests", s.inFlightRequests},
             {"activeLeases", s.activeLeases}};
    if (s.logPath) {
        j["logPath"] = *s.logPath;
    }
}

void from_json(const json& j, DaemonStatus& s) {
    s.pid = j.value("pid", int64_t{0});
    s.socketPath = j.value("socketPath", std::string{});
    if (auto it = j.find("logPath"); it != j.end() && it->is_string()) {
        s.logPath = it->get<std::string>();
    }
    s.startedAt = j.value("startedAt", std::string{});
    s.toolCount = j.value("toolCount", size_t{0});
    s.workspaceRoot = j.value("workspaceRoot", std::string{});
    s.workspaceKey = j.value("workspaceKey", std::string{});
    s.enabledWorkflows = j.value("enabledWorkflows", std::vector<std::string>{});
    s.version = j.value("version", std::string{});
    s.inFlightRequests = j.value("inFlightRequests", size_t{0});
    s.activeLeases = j.value("activeLeases", size_t{0});
}

void to_json(json& j, const ToolSummary& s) {
    j = json{{"name", s.name},
             {"workflow", s.workflow},
             {"description", s.description},
             {"stateful", s.stateful}};
}

void from_json(const json& j, ToolSummary& s) {
    s.name = j.value("name", std::string{});
    s.workflow = j.value("workflow", std::string{});
    s.description = j.value("description", std::string{});
    s.stateful = j.value("stateful", false);
}

void to_json(json& j, const BridgeToolInfo& t) {
    j = json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.inputSchema}};
}

void from_json(const json& j, BridgeToolInfo& t) {
    t.name = j.value("name", std::string{});
    t.description = j.value("description", std::string{});
    t.inputSchema = j.value("inputSchema", json::object());
}

} // namespace toolhub::daemon
