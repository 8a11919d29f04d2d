#include <taskfed/cli/command_registry.h>
#include <taskfed/cli/taskfed_cli.h>

namespace taskfed::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createListsCommand();
std::unique_ptr<ICommand> createGetCommand();
std::unique_ptr<ICommand> createDeleteCommand();
std::unique_ptr<ICommand> createConfigCommand();

void CommandRegistry::registerAllCommands(TaskfedCLI* cli) {
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createListsCommand());
    cli->registerCommand(CommandRegistry::createGetCommand());
    cli->registerCommand(CommandRegistry::createDeleteCommand());
    cli->registerCommand(CommandRegistry::createConfigCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::taskfed::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListsCommand() {
    return ::taskfed::cli::createListsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createGetCommand() {
    return ::taskfed::cli::createGetCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDeleteCommand() {
    return ::taskfed::cli::createDeleteCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createConfigCommand() {
    return ::taskfed::cli::createConfigCommand();
}

} // namespace taskfed::cli
