#include <toolhub/cli/cli_sync.h>
#include <toolhub/cli/command.h>
#include <toolhub/cli/toolhub_cli.h>
#include <toolhub/config/config_helpers.h>
#include <toolhub/tools/builtin_tools.h>
#include <toolhub/tools/tool_catalog.h>
#include <toolhub/tools/tool_invoker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace toolhub::cli {

namespace {

// Upper bound for one call: daemon auto-start plus a full request
constexpr std::chrono::seconds kCallTimeout{120};

// Catalog and invoker kept alive together for the duration of one call
struct CallSession {
    explicit CallSession(std::vector<tools::ToolDefinition> defs)
        : catalog(std::move(defs)), invoker(catalog) {}

    tools::ToolCatalog catalog;
    tools::ToolInvoker invoker;
};

boost::asio::awaitable<Result<tools::ToolResponse>>
invokeTool(std::shared_ptr<CallSession> session, std::string tool, nlohmann::json args,
           tools::InvokeOptions opts) {
    co_return co_await session->invoker.invoke(tool, std::move(args), opts);
}

} // namespace

class CallCommand : public ICommand {
public:
    std::string getName() const override { return "call"; }

    std::string getDescription() const override { return "Invoke a tool by name"; }

    void registerCommand(CLI::App& app, ToolhubCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("tool", tool_, "Tool name (cli name, kebab alias or MCP name)")
            ->required();
        cmd->add_option("--args", args_, "Tool arguments as a JSON object")->default_val("{}");
        cmd->add_option("--socket", socketPath_, "Daemon socket path (override)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        nlohmann::json args;
        try {
            args = nlohmann::json::parse(args_);
        } catch (const nlohmann::json::parse_error& e) {
            return Error{ErrorCode::InvalidArgument, std::string("Invalid --args JSON: ") + e.what()};
        }
        if (args.is_null()) {
            args = nlohmann::json::object();
        }
        if (!args.is_object()) {
            return Error{ErrorCode::InvalidArgument, "--args must be a JSON object"};
        }

        auto ws = cli_->workspace(socketPath_);
        if (!ws) {
            return ws.error();
        }

        tools::BuiltinContext ctx;
        ctx.socketPath = ws.value().socketPath;
        ctx.workspaceRoot = ws.value().root;
        ctx.workspaceKey = ws.value().key;
        auto session = std::make_shared<CallSession>(tools::builtinToolDefinitions(ctx));

        tools::InvokeOptions opts;
        opts.runtime = tools::Runtime::Cli;
        opts.socketPath = ws.value().socketPath;
        opts.workspaceRoot = ws.value().root;
        opts.startupTimeout = config::resolve_startup_timeout();
        opts.logLevel = config::env_value(config::kEnvLogLevel);

        auto response = run_sync(invokeTool(session, tool_, std::move(args), opts), kCallTimeout);
        if (!response) {
            return response.error();
        }

        const auto& r = response.value();
        if (cli_->jsonOutput()) {
            std::cout << r.toJson().dump(2) << "\n";
        } else {
            auto text = r.joinedText();
            if (!text.empty()) {
                std::cout << text << "\n";
            }
        }
        if (r.isError) {
            spdlog::debug("Tool '{}' returned an error response", tool_);
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

private:
    ToolhubCLI* cli_ = nullptr;
    std::string tool_;
    std::string args_ = "{}";
    std::string socketPath_;
};

// Factory function
std::unique_ptr<ICommand> createCallCommand() {
    return std::make_unique<CallCommand>();
}

} // namespace toolhub::cli
