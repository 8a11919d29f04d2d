#pragma once

#include <taskfed/cli/command.h>

#include <memory>

namespace taskfed::cli {

class TaskfedCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(TaskfedCLI* cli);

    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createListsCommand();
    static std::unique_ptr<ICommand> createGetCommand();
    static std::unique_ptr<ICommand> createDeleteCommand();
    static std::unique_ptr<ICommand> createConfigCommand();
};

} // namespace taskfed::cli
