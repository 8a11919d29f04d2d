#pragma once

#include <taskfed/config/data_source_config.h>
#include <taskfed/federation/data_source_router.h>
#include <taskfed/federation/multi_source_aggregator.h>
#include <taskfed/storage/storage_backend.h>

#include <memory>

namespace taskfed::federation {

/**
 * @brief The whole federation behind the single-backend interface.
 *
 * Single-key operations go through the DataSourceRouter; listing and search
 * fan out over the router's healthy sources through the MultiSourceAggregator.
 * Loads never fail: a routing failure is logged and reported as not found.
 * LoadOptions::projectTag and the list's own projectTag on save steer source
 * selection the same way OperationContext::projectTag does on the router.
 */
class RoutedStorageBackend : public storage::IStorageBackend {
public:
    RoutedStorageBackend(config::MultiSourceConfig config, DataSourceRouter::Dependencies deps);
    ~RoutedStorageBackend() override;

    boost::asio::awaitable<Result<void>> initialize() override;
    boost::asio::awaitable<bool> healthCheck() override;
    boost::asio::awaitable<Result<std::optional<model::TaskList>>>
    load(std::string key, storage::LoadOptions options, std::stop_token stop) override;
    boost::asio::awaitable<Result<void>> save(std::string key, model::TaskList list,
                                              storage::SaveOptions options,
                                              std::stop_token stop) override;
    boost::asio::awaitable<Result<void>> remove(std::string key, bool permanent,
                                                std::stop_token stop) override;
    boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
    list(storage::ListOptions options, std::stop_token stop) override;
    boost::asio::awaitable<void> shutdown() override;

    std::string getType() const override { return "routed"; }

    /**
     * @brief Full-record search across every healthy source.
     * With no healthy source the result is empty, not an error.
     */
    boost::asio::awaitable<Result<SearchResult<model::TaskList>>> search(SearchQuery query);

    /**
     * @brief Summary search across every healthy source.
     */
    boost::asio::awaitable<Result<SearchResult<model::TaskListSummary>>>
    searchSummaries(SearchQuery query);

    DataSourceRouter& router() { return *router_; }
    const DataSourceRouter& router() const { return *router_; }
    const MultiSourceAggregator& aggregator() const { return aggregator_; }
    const config::MultiSourceConfig& getConfig() const { return config_; }

private:
    config::MultiSourceConfig config_;
    std::unique_ptr<DataSourceRouter> router_;
    MultiSourceAggregator aggregator_;
};

} // namespace taskfed::federation
