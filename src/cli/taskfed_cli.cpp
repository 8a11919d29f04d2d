#include <taskfed/cli/command_registry.h>
#include <taskfed/cli/taskfed_cli.h>
#include <taskfed/config/data_source_loader.h>
#include <taskfed/config/logging.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <future>
#include <iostream>
#include <memory>

namespace taskfed::cli {

TaskfedCLI::TaskfedCLI(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {
    // Finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Federated task list storage", "taskfed");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", TASKFED_VERSION_STRING);

    app_->add_option("-c,--config", configPath_, "Data source configuration file (JSON)");
    app_->add_option("--log-level", logLevel_, "Log level: trace, debug, info, warn, error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app_->add_option("--log-file", logFile_, "Write logs to a rotating file instead of stderr");
    app_->add_option("--timeout", timeoutSeconds_, "Give up on the command after this many seconds")
        ->check(CLI::PositiveNumber);

    CommandRegistry::registerAllCommands(this);
}

TaskfedCLI::~TaskfedCLI() = default;

void TaskfedCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int TaskfedCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        config::LoggingOptions logging;
        logging.level = logLevel_;
        if (logFile_) {
            logging.file = *logFile_;
        }
        if (auto r = config::configureLogging(logging); !r) {
            std::cerr << "Error: " << r.error().message << "\n";
            return 2;
        }

        if (!pendingCommand_) {
            return 0;
        }

        auto prom = std::make_shared<std::promise<Result<void>>>();
        auto fut = prom->get_future();
        boost::asio::co_spawn(
            executor_,
            [this, prom]() -> boost::asio::awaitable<void> {
                try {
                    auto r = co_await runPending();
                    prom->set_value(std::move(r));
                } catch (const std::exception& e) {
                    prom->set_value(Error{ErrorCode::InternalError, e.what()});
                }
            },
            boost::asio::detached);

        if (fut.wait_for(std::chrono::seconds(timeoutSeconds_)) != std::future_status::ready) {
            spdlog::error("[CLI] Command timed out after {}s, shutting storage down",
                          timeoutSeconds_);
            std::cerr << "Error: " << errorToString(ErrorCode::Timeout) << "\n";
            // The command still references this object. Source operations are
            // bounded by their own timeouts, so stop routing new ones and wait
            // for the command to unwind.
            auto stopped = std::make_shared<std::promise<void>>();
            auto stoppedFut = stopped->get_future();
            boost::asio::co_spawn(
                executor_,
                [this, stopped]() -> boost::asio::awaitable<void> {
                    if (auto storage = storage_) {
                        co_await storage->shutdown();
                    }
                    stopped->set_value();
                },
                boost::asio::detached);
            stoppedFut.wait();
            fut.wait();
            return 1;
        }
        auto result = fut.get();
        if (!result) {
            std::cerr << "Error: " << errorToString(result.error().code) << ": "
                      << result.error().message << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
}

boost::asio::awaitable<Result<void>> TaskfedCLI::runPending() {
    auto result = co_await pendingCommand_->executeAsync();
    if (storage_) {
        co_await storage_->shutdown();
        storage_.reset();
    }
    co_return result;
}

Result<config::MultiSourceConfig> TaskfedCLI::loadConfig() const {
    config::LoaderOptions options;
    if (configPath_) {
        options.configPath = *configPath_;
        options.requireConfigFile = true;
    }
    return config::DataSourceConfigLoader{}.load(options);
}

boost::asio::awaitable<Result<federation::RoutedStorageBackend*>> TaskfedCLI::ensureStorage() {
    if (storage_) {
        co_return storage_.get();
    }

    auto cfg = loadConfig();
    if (!cfg) {
        co_return cfg.error();
    }

    federation::DataSourceRouter::Dependencies deps;
    deps.executor = executor_;
    auto storage = std::make_shared<federation::RoutedStorageBackend>(std::move(cfg).value(),
                                                                      std::move(deps));
    if (auto r = co_await storage->initialize(); !r) {
        co_return r.error();
    }
    storage_ = std::move(storage);
    co_return storage_.get();
}

void TaskfedCLI::printJson(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace taskfed::cli
