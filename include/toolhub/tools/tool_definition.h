#pragma once

#include <toolhub/tools/tool_response.h>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace toolhub::tools {

// Handler for one operation. Handlers report operation failures through
// ToolResponse::isError; a thrown exception is treated as an infrastructure failure.
using ToolHandler = std::function<boost::asio::awaitable<ToolResponse>(json args)>;

struct ToolDefinition {
    std::string cliName;
    std::string mcpName;
    std::string workflowId;
    std::string description;
    bool stateful = false;
    // Set for tools discovered through the IDE bridge
    std::optional<std::string> bridgeRemoteName;
    ToolHandler handler;

    [[nodiscard]] bool bridged() const noexcept { return bridgeRemoteName.has_value(); }
};

} // namespace toolhub::tools
