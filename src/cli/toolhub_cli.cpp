#include <toolhub/cli/command_registry.h>
#include <toolhub/cli/toolhub_cli.h>
#include <toolhub/config/config_helpers.h>
#include <toolhub/daemon/ipc/socket_utils.h>
#include <toolhub/version.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <string_view>

namespace toolhub::cli {

ToolhubCLI::ToolhubCLI() {
    app_ = std::make_unique<CLI::App>("toolhub - workspace tool host", "toolhub");
    app_->set_version_flag("--version", std::string(TOOLHUB_VERSION_STRING));
    app_->require_subcommand(1);

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
}

ToolhubCLI::~ToolhubCLI() = default;

void ToolhubCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

Result<WorkspaceContext> ToolhubCLI::workspace(const std::string& socketOverride) const {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot determine working directory: " + ec.message()};
    }
    auto identity = daemon::socket_utils::resolve_workspace(cwd);
    if (!identity) {
        return identity.error();
    }

    WorkspaceContext ctx;
    ctx.root = identity.value().root;
    ctx.key = identity.value().key;
    ctx.socketPath = socketOverride.empty()
                         ? daemon::socket_utils::resolve_socket_path(ctx.key)
                         : std::filesystem::path(config::expand_tilde(socketOverride));
    return ctx;
}

void ToolhubCLI::configureLogging() const {
    auto logger = std::make_shared<spdlog::logger>(
        "toolhub", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int ToolhubCLI::run(int argc, char* argv[]) {
    try {
        configureLogging();
        CommandRegistry::registerAllCommands(this);

        // Bare 'toolhub daemon' shows status
        std::vector<char*> args(argv, argv + argc);
        static std::string statusStr = "status";
        if (argc > 1 && argv[1] && std::string_view(argv[1]) == "daemon") {
            bool hasSub = false;
            for (int i = 2; i < argc; ++i) {
                if (argv[i] && argv[i][0] != '-') {
                    hasSub = true;
                    break;
                }
            }
            const bool wantsHelp = std::any_of(args.begin() + 2, args.end(), [](const char* a) {
                return a && (std::string_view(a) == "--help" || std::string_view(a) == "-h");
            });
            if (!hasSub && !wantsHelp) {
                args.push_back(statusStr.data());
            }
        }

        app_->parse(static_cast<int>(args.size()), args.data());

        // --verbose may appear anywhere on the command line
        configureLogging();

        if (!pendingCommand_) {
            return 0;
        }
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                          result.error().message, errorToString(result.error().code));
            std::cerr << "Error: " << result.error().message << "\n";
            return 1;
        }
        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace toolhub::cli
