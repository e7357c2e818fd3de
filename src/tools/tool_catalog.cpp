#include <toolhub/tools/tool_catalog.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace toolhub::tools {

namespace {

std::string lower_trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string toKebabCase(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    char prev = '\0';
    for (char raw : name) {
        auto c = static_cast<unsigned char>(raw);
        if (raw == '_' || raw == '-' || std::isspace(c)) {
            if (!out.empty() && out.back() != '-') {
                out.push_back('-');
            }
        } else {
            bool boundary = std::isupper(c) && (std::islower(static_cast<unsigned char>(prev)) ||
                                                std::isdigit(static_cast<unsigned char>(prev)));
            if (boundary && !out.empty() && out.back() != '-') {
                out.push_back('-');
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        }
        prev = raw;
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

ToolCatalog::ToolCatalog(std::vector<ToolDefinition> tools) : tools_(std::move(tools)) {
    for (size_t i = 0; i < tools_.size(); ++i) {
        const auto& def = tools_[i];
        auto cli = lower_trimmed(def.cliName);
        if (!cli.empty()) {
            auto [it, inserted] = byCliName_.emplace(cli, i);
            if (!inserted) {
                spdlog::warn("Duplicate CLI name '{}' ({}/{} shadowed by {}/{})", def.cliName,
                             def.workflowId, def.mcpName, tools_[it->second].workflowId,
                             tools_[it->second].mcpName);
            }
        }
        if (auto kebab = toKebabCase(def.mcpName); !kebab.empty()) {
            byKebabAlias_.emplace(std::move(kebab), i);
        }
        if (auto mcp = lower_trimmed(def.mcpName); !mcp.empty()) {
            byMcpName_.emplace(std::move(mcp), i);
        }
    }
}

ResolveResult ToolCatalog::resolve(std::string_view input) const {
    ResolveResult result;
    const auto needle = lower_trimmed(input);
    if (needle.empty()) {
        return result;
    }

    if (auto it = byCliName_.find(needle); it != byCliName_.end()) {
        result.status = ResolveStatus::Found;
        result.tool = &tools_[it->second];
        return result;
    }

    const auto kebab = toKebabCase(input);
    auto [first, last] = byKebabAlias_.equal_range(kebab);
    if (first != last) {
        if (std::next(first) == last) {
            result.status = ResolveStatus::Found;
            result.tool = &tools_[first->second];
            return result;
        }
        result.status = ResolveStatus::Ambiguous;
        for (auto it = first; it != last; ++it) {
            result.candidates.push_back(tools_[it->second].cliName);
        }
        return result;
    }

    if (auto it = byMcpName_.find(needle); it != byMcpName_.end()) {
        result.status = ResolveStatus::Found;
        result.tool = &tools_[it->second];
        return result;
    }
    return result;
}

std::vector<std::string> ToolCatalog::workflows() const {
    std::set<std::string> ids;
    for (const auto& def : tools_) {
        ids.insert(def.workflowId);
    }
    return {ids.begin(), ids.end()};
}

} // namespace toolhub::tools
