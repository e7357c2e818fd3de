#include <toolhub/cli/command_registry.h>
#include <toolhub/cli/toolhub_cli.h>

namespace toolhub::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createDaemonCommand();
std::unique_ptr<ICommand> createToolsCommand();
std::unique_ptr<ICommand> createCallCommand();

void CommandRegistry::registerAllCommands(ToolhubCLI* cli) {
    cli->registerCommand(CommandRegistry::createDaemonCommand());
    cli->registerCommand(CommandRegistry::createToolsCommand());
    cli->registerCommand(CommandRegistry::createCallCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createDaemonCommand() {
    return ::toolhub::cli::createDaemonCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createToolsCommand() {
    return ::toolhub::cli::createToolsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createCallCommand() {
    return ::toolhub::cli::createCallCommand();
}

} // namespace toolhub::cli
