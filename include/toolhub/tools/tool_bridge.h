#pragma once

#include <toolhub/core/types.h>
#include <toolhub/tools/tool_response.h>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <vector>

namespace toolhub::tools {

struct BridgedTool {
    std::string name;
    std::string description;
    json inputSchema = json::object();
};

// Connection to an IDE-hosted tool server. The daemon owns at most one bridge and forwards
// bridge.list / bridge.invoke to it.
class IToolBridge {
public:
    virtual ~IToolBridge() = default;

    virtual boost::asio::awaitable<Result<std::vector<BridgedTool>>> listTools() = 0;
    virtual boost::asio::awaitable<Result<ToolResponse>> invokeTool(const std::string& name,
                                                                    json args) = 0;
};

} // namespace toolhub::tools
