#include <toolhub/cli/toolhub_cli.h>

#include <csignal>

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    toolhub::cli::ToolhubCLI cli;
    return cli.run(argc, argv);
}
