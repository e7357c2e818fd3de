#include <toolhub/tools/tool_response.h>

namespace toolhub::tools {

ToolResponse ToolResponse::fromText(std::string text) {
    ToolResponse res;
    res.content.push_back({"text", std::move(text)});
    return res;
}

ToolResponse ToolResponse::error(const std::string& title, const std::string& detail) {
    ToolResponse res;
    std::string text = "Error: " + title;
    if (!detail.empty()) {
        text += "\n" + detail;
    }
    res.content.push_back({"text", std::move(text)});
    res.isError = true;
    return res;
}

std::string ToolResponse::joinedText() const {
    std::string out;
    for (const auto& item : content) {
        if (item.type != "text") {
            continue;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += item.text;
    }
    return out;
}

ToolResponse ToolResponse::fromJson(const json& j) {
    ToolResponse res;
    if (!j.is_object()) {
        return res;
    }
    if (auto it = j.find("content"); it != j.end() && it->is_array()) {
        for (const auto& item : *it) {
            if (!item.is_object()) {
                continue;
            }
            ToolContent c;
            c.type = item.value("type", std::string{"text"});
            c.text = item.value("text", std::string{});
            res.content.push_back(std::move(c));
        }
    }
    res.isError = j.value("isError", false);
    return res;
}

json ToolResponse::toJson() const {
    json items = json::array();
    for (const auto& c : content) {
        items.push_back(json{{"type", c.type}, {"text", c.text}});
    }
    json j{{"content", std::move(items)}};
    if (isError) {
        j["isError"] = true;
    }
    return j;
}

} // namespace toolhub::tools
