#pragma once

#include <toolhub/cli/command.h>

#include <memory>

namespace toolhub::cli {

class ToolhubCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(ToolhubCLI* cli);

    // daemon start|stop|status|restart|list|logs
    static std::unique_ptr<ICommand> createDaemonCommand();

    // tools [--json]
    static std::unique_ptr<ICommand> createToolsCommand();

    // call <tool> [--args JSON] [--socket PATH]
    static std::unique_ptr<ICommand> createCallCommand();
};

} // namespace toolhub::cli
