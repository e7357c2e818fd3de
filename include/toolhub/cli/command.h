#pragma once

#include <toolhub/core/types.h>

#include <CLI/CLI.hpp>

#include <string>

namespace toolhub::cli {

class ToolhubCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "daemon", "call")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app. Subcommand callbacks should call
     * ToolhubCLI::setPendingCommand so the work runs after parsing has finished.
     */
    virtual void registerCommand(CLI::App& app, ToolhubCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace toolhub::cli
