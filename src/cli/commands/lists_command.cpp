#include <taskfed/cli/command.h>
#include <taskfed/cli/taskfed_cli.h>
#include <taskfed/core/format.h>
#include <taskfed/federation/search_query.h>

#include <nlohmann/json.hpp>

namespace taskfed::cli {

namespace {

template <typename T> nlohmann::json renderResult(const federation::SearchResult<T>& result) {
    nlohmann::json j;
    j["items"] = result.items;
    j["totalCount"] = result.totalCount;
    j["hasMore"] = result.hasMore;
    if (result.pagination) {
        j["pagination"] = {{"offset", result.pagination->offset},
                           {"limit", result.pagination->limit}};
    }
    return j;
}

} // namespace

class ListsCommand : public ICommand {
public:
    std::string getName() const override { return "lists"; }

    std::string getDescription() const override {
        return "List task lists merged across every healthy source";
    }

    void registerCommand(CLI::App& app, TaskfedCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("lists", getDescription());
        cmd->alias("ls");
        cmd->add_option("--text", text_, "Case-insensitive match on title or description");
        cmd->add_option("--tag", projectTag_, "Only lists with this project tag");
        cmd->add_option("--status", status_, "active, completed or all")
            ->check(CLI::IsMember({"active", "completed", "all"}));
        cmd->add_option("--sort", sort_,
                        "title, status, priority, createdAt, updatedAt, completedAt");
        cmd->add_flag("--desc", descending_, "Sort descending");
        cmd->add_option("--limit", limit_, "Page size");
        cmd->add_option("--offset", offset_, "Number of lists to skip");
        cmd->add_flag("--archived", includeArchived_, "Include archived lists");
        cmd->add_flag("--full", full_, "Return complete lists instead of summaries");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    boost::asio::awaitable<Result<void>> executeAsync() override {
        auto query = buildQuery();
        if (!query) {
            co_return query.error();
        }

        auto storage = co_await cli_->ensureStorage();
        if (!storage) {
            co_return storage.error();
        }

        if (full_) {
            auto result = co_await storage.value()->search(std::move(query).value());
            if (!result) {
                co_return result.error();
            }
            TaskfedCLI::printJson(renderResult(result.value()));
        } else {
            auto result = co_await storage.value()->searchSummaries(std::move(query).value());
            if (!result) {
                co_return result.error();
            }
            TaskfedCLI::printJson(renderResult(result.value()));
        }
        co_return Result<void>{};
    }

private:
    Result<federation::SearchQuery> buildQuery() const {
        federation::SearchQuery query;
        query.text = text_;
        query.projectTag = projectTag_;
        query.includeArchived = includeArchived_;

        if (status_) {
            query.status = federation::parseListStatusFilter(*status_);
        }
        if (sort_) {
            auto field = federation::parseSortField(*sort_);
            if (!field) {
                return Error{ErrorCode::InvalidArgument,
                             format("Unknown sort field '{}'", *sort_)};
            }
            query.sorting = federation::SortOptions{
                *field, descending_ ? federation::SortDirection::Desc
                                    : federation::SortDirection::Asc};
        }
        if (limit_ || offset_) {
            query.pagination = federation::PaginationOptions{limit_, offset_};
        }
        return query;
    }

    TaskfedCLI* cli_ = nullptr;
    std::optional<std::string> text_;
    std::optional<std::string> projectTag_;
    std::optional<std::string> status_;
    std::optional<std::string> sort_;
    bool descending_ = false;
    std::optional<size_t> limit_;
    std::optional<size_t> offset_;
    bool includeArchived_ = false;
    bool full_ = false;
};

std::unique_ptr<ICommand> createListsCommand() {
    return std::make_unique<ListsCommand>();
}

} // namespace taskfed::cli
