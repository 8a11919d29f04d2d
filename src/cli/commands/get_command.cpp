#include <taskfed/cli/command.h>
#include <taskfed/cli/taskfed_cli.h>
#include <taskfed/core/format.h>

#include <nlohmann/json.hpp>

namespace taskfed::cli {

class GetCommand : public ICommand {
public:
    std::string getName() const override { return "get"; }

    std::string getDescription() const override {
        return "Read one task list from the highest-priority healthy source";
    }

    void registerCommand(CLI::App& app, TaskfedCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("get", getDescription());
        cmd->add_option("id", id_, "Task list id")->required();
        cmd->add_option("--tag", projectTag_, "Prefer sources tagged with this project");
        cmd->add_flag("--archived", includeArchived_, "Return the list even if archived");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    boost::asio::awaitable<Result<void>> executeAsync() override {
        auto storage = co_await cli_->ensureStorage();
        if (!storage) {
            co_return storage.error();
        }

        federation::OperationContext context;
        context.projectTag = projectTag_;
        context.listId = id_;
        storage::LoadOptions options;
        options.includeArchived = includeArchived_;

        auto result = co_await storage.value()->router().read(id_, context, options);
        if (!result) {
            co_return result.error();
        }
        if (!result.value()) {
            co_return Error{ErrorCode::NotFound, format("Task list '{}' not found", id_)};
        }
        TaskfedCLI::printJson(nlohmann::json(*result.value()));
        co_return Result<void>{};
    }

private:
    TaskfedCLI* cli_ = nullptr;
    std::string id_;
    std::optional<std::string> projectTag_;
    bool includeArchived_ = false;
};

std::unique_ptr<ICommand> createGetCommand() {
    return std::make_unique<GetCommand>();
}

} // namespace taskfed::cli
