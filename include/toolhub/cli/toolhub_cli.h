#pragma once

#include <toolhub/cli/command.h>
#include <toolhub/core/types.h>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhub::cli {

// Workspace the CLI was started in and the daemon socket serving it
struct WorkspaceContext {
    std::filesystem::path root;
    std::string key;
    std::filesystem::path socketPath;
};

class ToolhubCLI {
public:
    ToolhubCLI();
    ~ToolhubCLI();

    ToolhubCLI(const ToolhubCLI&) = delete;
    ToolhubCLI& operator=(const ToolhubCLI&) = delete;

    // Parses, runs the selected command and returns the process exit code
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);
    void setPendingCommand(ICommand* command) { pendingCommand_ = command; }

    // Exit code for a command that completed but must still report failure
    void setExitCode(int code) { exitCode_ = code; }

    // Resolved from the working directory; socketOverride wins over TOOLHUB_SOCKET and config
    Result<WorkspaceContext> workspace(const std::string& socketOverride = {}) const;

    bool verbose() const { return verbose_; }
    bool jsonOutput() const { return jsonOutput_; }
    CLI::App& app() { return *app_; }

private:
    void configureLogging() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;
    int exitCode_ = 0;
    bool verbose_ = false;
    bool jsonOutput_ = false;
};

} // namespace toolhub::cli
