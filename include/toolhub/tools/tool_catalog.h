#pragma once

#include <toolhub/tools/tool_definition.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolhub::tools {

// Lower-case kebab form: "list_sims", "listSims" and "LIST_SIMS" all become "list-sims"
std::string toKebabCase(std::string_view name);

enum class ResolveStatus { Found, Ambiguous, NotFound };

struct ResolveResult {
    ResolveStatus status = ResolveStatus::NotFound;
    const ToolDefinition* tool = nullptr;
    // cliNames of every match when ambiguous
    std::vector<std::string> candidates;

    [[nodiscard]] bool found() const noexcept { return status == ResolveStatus::Found; }
};

// Immutable name index over a fixed set of tool definitions. Resolution order: exact cliName,
// kebab alias of the mcpName (ambiguous when several tools share it), raw mcpName.
class ToolCatalog {
public:
    explicit ToolCatalog(std::vector<ToolDefinition> tools);

    ToolCatalog(const ToolCatalog&) = delete;
    ToolCatalog& operator=(const ToolCatalog&) = delete;
    ToolCatalog(ToolCatalog&&) = default;
    ToolCatalog& operator=(ToolCatalog&&) = default;

    [[nodiscard]] ResolveResult resolve(std::string_view input) const;

    [[nodiscard]] const std::vector<ToolDefinition>& tools() const noexcept { return tools_; }
    [[nodiscard]] size_t size() const noexcept { return tools_.size(); }

    // Sorted, unique workflow ids
    [[nodiscard]] std::vector<std::string> workflows() const;

private:
    std::vector<ToolDefinition> tools_;
    std::map<std::string, size_t, std::less<>> byCliName_;
    std::multimap<std::string, size_t, std::less<>> byKebabAlias_;
    std::map<std::string, size_t, std::less<>> byMcpName_;
};

} // namespace toolhub::tools
