#include <toolhub/cli/command.h>
#include <toolhub/cli/toolhub_cli.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>
#include <toolhub/tools/builtin_tools.h>
#include <toolhub/tools/tool_catalog.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace toolhub::cli {

class ToolsCommand : public ICommand {
public:
    std::string getName() const override { return "tools"; }

    std::string getDescription() const override { return "List available tools"; }

    void registerCommand(CLI::App& app, ToolhubCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_flag("--json", json_, "Output in JSON format");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ws = cli_->workspace();
        if (!ws) {
            return ws.error();
        }
        tools::BuiltinContext ctx;
        ctx.socketPath = ws.value().socketPath;
        ctx.workspaceRoot = ws.value().root;
        ctx.workspaceKey = ws.value().key;
        tools::ToolCatalog catalog(tools::builtinToolDefinitions(ctx));

        if (json_ || cli_->jsonOutput()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& def : catalog.tools()) {
                out.push_back(daemon::ToolSummary{def.cliName, def.workflowId, def.description,
                                                  def.stateful});
            }
            std::cout << out.dump(2) << "\n";
            return Result<void>();
        }

        size_t width = 0;
        for (const auto& def : catalog.tools()) {
            width = std::max(width, def.cliName.size());
        }
        for (const auto& workflow : catalog.workflows()) {
            std::cout << workflow << "\n";
            for (const auto& def : catalog.tools()) {
                if (def.workflowId != workflow) {
                    continue;
                }
                std::cout << "  " << std::left << std::setw(static_cast<int>(width) + 2)
                          << def.cliName << def.description;
                if (def.stateful) {
                    std::cout << " [daemon]";
                }
                std::cout << "\n";
            }
        }
        std::cout << "\n" << catalog.size() << " tools. Run 'toolhub call <tool>' to invoke one.\n";
        return Result<void>();
    }

private:
    ToolhubCLI* cli_ = nullptr;
    bool json_ = false;
};

// Factory function
std::unique_ptr<ICommand> createToolsCommand() {
    return std::make_unique<ToolsCommand>();
}

} // namespace toolhub::cli
