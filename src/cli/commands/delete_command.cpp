#include <taskfed/cli/command.h>
#include <taskfed/cli/taskfed_cli.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace taskfed::cli {

class DeleteCommand : public ICommand {
public:
    std::string getName() const override { return "delete"; }

    std::string getDescription() const override {
        return "Archive (or permanently delete) a task list on the primary writable source";
    }

    void registerCommand(CLI::App& app, TaskfedCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("delete", getDescription());
        cmd->alias("rm");
        cmd->add_option("id", id_, "Task list id")->required();
        cmd->add_flag("--permanent", permanent_, "Remove the list instead of archiving it");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    boost::asio::awaitable<Result<void>> executeAsync() override {
        auto storage = co_await cli_->ensureStorage();
        if (!storage) {
            co_return storage.error();
        }

        auto result = co_await storage.value()->router().remove(id_, permanent_);
        if (!result) {
            co_return result;
        }
        spdlog::info("[CLI] Deleted '{}'{}", id_, permanent_ ? " permanently" : "");
        TaskfedCLI::printJson({{"deleted", id_}, {"permanent", permanent_}});
        co_return Result<void>{};
    }

private:
    TaskfedCLI* cli_ = nullptr;
    std::string id_;
    bool permanent_ = false;
};

std::unique_ptr<ICommand> createDeleteCommand() {
    return std::make_unique<DeleteCommand>();
}

} // namespace taskfed::cli
