#pragma once

#include <toolhub/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolhub::daemon {

using json = nlohmann::json;

// ============================================================================
// Protocol Constants
// ============================================================================

constexpr int PROTOCOL_VERSION = 1;
constexpr size_t MAX_MESSAGE_SIZE =
    static_cast<size_t>(100) * static_cast<size_t>(1024) * static_cast<size_t>(1024); // 100MiB

namespace methods {
inline constexpr std::string_view DaemonStatus = "daemon.status";
inline constexpr std::string_view DaemonStop = "daemon.stop";
inline constexpr std::string_view ToolList = "tool.list";
inline constexpr std::string_view ToolInvoke = "tool.invoke";
inline constexpr std::string_view BridgeList = "bridge.list";
inline constexpr std::string_view BridgeInvoke = "bridge.invoke";
} // namespace methods

// Wire-level error codes carried in Response.error.code
enum class ProtocolErrorCode { BadRequest, NotFound, AmbiguousTool, ToolFailed, Internal };

const char* protocolErrorCodeName(ProtocolErrorCode code) noexcept;
std::optional<ProtocolErrorCode> parseProtocolErrorCode(std::string_view name) noexcept;

struct ProtocolError {
    ProtocolErrorCode code = ProtocolErrorCode::Internal;
    std::string message;
    std::optional<json> data;
};

// ============================================================================
// Envelopes
// ============================================================================

struct Request {
    int version = PROTOCOL_VERSION;
    std::string id;
    std::string method;
    json params = json::object();
};

struct Response {
    int version = PROTOCOL_VERSION;
    std::string id;
    std::optional<json> result;
    std::optional<ProtocolError> error;

    static Response success(std::string id, json result);
    static Response failure(std::string id, ProtocolErrorCode code, std::string message,
                            std::optional<json> data = std::nullopt);

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

json toJson(const Request& req);
json toJson(const Response& res);

// Strict decoding of a Request envelope. Any shape violation is InvalidData.
Result<Request> parseRequest(const json& j);
Result<Response> parseResponse(const json& j);

// Best-effort id extraction for replying to malformed requests
std::string extractRequestId(const json& j);

// Unique request id for this process (pid, counter and clock based)
std::string generateRequestId();

// ============================================================================
// Method payloads
// ============================================================================

struct DaemonStatus {
    int64_t pid = 0;
    std::string socketPath;
    std::optional<std::string> logPath;
    std::string startedAt;
    size_t toolCount = 0;
    std::string workspaceRoot;
    std::string workspaceKey;
    std::vector<std::string> enabledWorkflows;
    std::string version;
    size_t inFlightRequests = 0;
    size_t activeLeases = 0;
};

void to_json(json& j, const DaemonStatus& s);
void from_json(const json& j, DaemonStatus& s);

struct ToolSummary {
    std::string name;
    std::string workflow;
    std::string description;
    bool stateful = false;
};

void to_json(json& j, const ToolSummary& s);
void from_json(const json& j, ToolSummary& s);

// Remote tool advertised by the IDE bridge
struct BridgeToolInfo {
    std::string name;
    std::string description;
    json inputSchema = json::object();
};

void to_json(json& j, const BridgeToolInfo& t);
void from_json(const json& j, BridgeToolInfo& t);

} // namespace toolhub::daemon
