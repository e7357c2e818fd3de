#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace toolhub::tools {

using json = nlohmann::json;

struct ToolContent {
    std::string type = "text";
    std::string text;
};

// Structured handler result, shaped like an MCP tool call result
struct ToolResponse {
    std::vector<ToolContent> content;
    bool isError = false;

    static ToolResponse fromText(std::string text);
    // Error text is rendered as "Error: <title>\n<detail>"
    static ToolResponse error(const std::string& title, const std::string& detail);

    // Text items joined with newlines
    std::string joinedText() const;

    static ToolResponse fromJson(const json& j);
    json toJson() const;
};

} // namespace toolhub::tools
