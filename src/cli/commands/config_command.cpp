#include <taskfed/cli/command.h>
#include <taskfed/cli/taskfed_cli.h>
#include <taskfed/config/data_source_loader.h>

#include <nlohmann/json.hpp>

namespace taskfed::cli {

class ConfigCommand : public ICommand {
public:
    std::string getName() const override { return "config"; }

    std::string getDescription() const override { return "Inspect data source configuration"; }

    void registerCommand(CLI::App& app, TaskfedCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("config", getDescription());
        cmd->require_subcommand(1);

        auto* checkCmd =
            cmd->add_subcommand("check", "Load and validate the configuration, then print it");
        checkCmd->callback([this]() {
            action_ = Action::Check;
            cli_->setPendingCommand(this);
        });

        auto* initCmd = cmd->add_subcommand("init", "Write the default configuration to a file");
        initCmd->add_option("path", initPath_, "Destination file")
            ->default_val("config/data-sources.json");
        initCmd->callback([this]() {
            action_ = Action::Init;
            cli_->setPendingCommand(this);
        });
    }

    boost::asio::awaitable<Result<void>> executeAsync() override {
        switch (action_) {
            case Action::Check:
                co_return check();
            case Action::Init:
                co_return init();
        }
        co_return Error{ErrorCode::InvalidArgument, "Unknown config action"};
    }

private:
    enum class Action { Check, Init };

    Result<void> check() const {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            TaskfedCLI::printJson({{"valid", false}, {"error", cfg.error().message}});
            return cfg.error();
        }
        TaskfedCLI::printJson({{"valid", true}, {"config", config::toJson(cfg.value())}});
        return {};
    }

    Result<void> init() const {
        config::DataSourceConfigLoader loader;
        if (auto r = loader.save(config::defaultMultiSourceConfig(), initPath_); !r) {
            return r;
        }
        TaskfedCLI::printJson({{"written", initPath_}});
        return {};
    }

    TaskfedCLI* cli_ = nullptr;
    Action action_ = Action::Check;
    std::string initPath_ = "config/data-sources.json";
};

std::unique_ptr<ICommand> createConfigCommand() {
    return std::make_unique<ConfigCommand>();
}

} // namespace taskfed::cli
