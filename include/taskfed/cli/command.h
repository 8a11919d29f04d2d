#pragma once

#include <taskfed/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <CLI/CLI.hpp>

#include <string>

namespace taskfed::cli {

class TaskfedCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "lists", "get")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, TaskfedCLI* cli) = 0;

    /**
     * Run the command on the CLI's executor
     */
    virtual boost::asio::awaitable<Result<void>> executeAsync() = 0;
};

} // namespace taskfed::cli
