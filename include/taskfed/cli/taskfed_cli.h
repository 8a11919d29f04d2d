#pragma once

#include <taskfed/cli/command.h>
#include <taskfed/config/data_source_config.h>
#include <taskfed/federation/routed_storage_backend.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taskfed::cli {

/**
 * Main CLI application class
 *
 * Commands run as coroutines on the executor given at construction. That
 * executor must be served by a single thread: the federated storage it
 * builds keeps unlocked per-source bookkeeping.
 */
class TaskfedCLI {
public:
    explicit TaskfedCLI(boost::asio::any_io_executor executor);
    ~TaskfedCLI();

    /**
     * Run the CLI with given arguments
     *
     * Blocks until the command coroutine has finished, also when --timeout
     * expires: the timeout shuts the storage down and reports an error.
     * @return Process exit code
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    /**
     * Load and validate the data source configuration named by --config
     * (or found in the default locations)
     */
    Result<config::MultiSourceConfig> loadConfig() const;

    /**
     * Federated storage, built and initialized on first use
     */
    boost::asio::awaitable<Result<federation::RoutedStorageBackend*>> ensureStorage();

    const std::optional<std::string>& getConfigPath() const { return configPath_; }
    boost::asio::any_io_executor getExecutor() const { return executor_; }

    /**
     * Pretty-print a JSON document on stdout
     */
    static void printJson(const nlohmann::json& j);

private:
    boost::asio::awaitable<Result<void>> runPending();

    boost::asio::any_io_executor executor_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::optional<std::string> configPath_;
    std::string logLevel_ = "warn";
    std::optional<std::string> logFile_;
    int timeoutSeconds_ = 600;

    std::shared_ptr<federation::RoutedStorageBackend> storage_;
};

} // namespace taskfed::cli
