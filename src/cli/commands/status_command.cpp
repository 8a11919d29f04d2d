#include <taskfed/cli/command.h>
#include <taskfed/cli/taskfed_cli.h>
#include <taskfed/core/time_utils.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace taskfed::cli {

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show health, priority and failure counts of every data source";
    }

    void registerCommand(CLI::App& app, TaskfedCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    boost::asio::awaitable<Result<void>> executeAsync() override {
        auto storage = co_await cli_->ensureStorage();
        if (!storage) {
            co_return storage.error();
        }

        auto status = storage.value()->router().getStatus();
        nlohmann::json j;
        j["total"] = status.total;
        j["healthy"] = status.healthy;
        j["unhealthy"] = status.unhealthy;
        j["sources"] = nlohmann::json::array();
        for (const auto& source : status.sources) {
            j["sources"].push_back({{"id", source.id},
                                    {"name", source.name},
                                    {"type", config::toString(source.type)},
                                    {"healthy", source.healthy},
                                    {"readonly", source.readonly},
                                    {"priority", source.priority},
                                    {"failureCount", source.failureCount},
                                    {"tags", source.tags},
                                    {"lastHealthCheck", time::formatIso8601(source.lastHealthCheck)}});
        }
        TaskfedCLI::printJson(j);
        co_return Result<void>{};
    }

private:
    TaskfedCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace taskfed::cli
