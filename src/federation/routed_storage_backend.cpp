#include <taskfed/federation/routed_storage_backend.h>

#include <spdlog/spdlog.h>

namespace taskfed::federation {

namespace {

OperationContext contextFor(const std::optional<std::string>& projectTag) {
    OperationContext context;
    context.projectTag = projectTag;
    return context;
}

} // namespace

RoutedStorageBackend::RoutedStorageBackend(config::MultiSourceConfig config,
                                           DataSourceRouter::Dependencies deps)
    : config_(std::move(config)),
      router_(std::make_unique<DataSourceRouter>(config_.sources, config_.routerConfig(),
                                                 std::move(deps))),
      aggregator_(config_.aggregatorConfig()) {}

RoutedStorageBackend::~RoutedStorageBackend() = default;

boost::asio::awaitable<Result<void>> RoutedStorageBackend::initialize() {
    co_await router_->initialize();
    auto status = router_->getStatus();
    if (status.healthy == 0) {
        spdlog::warn("[RoutedStorage] No healthy source after initialization ({} configured)",
                     status.total);
    }
    co_return Result<void>{};
}

boost::asio::awaitable<bool> RoutedStorageBackend::healthCheck() {
    co_return !router_->isShuttingDown() && router_->getStatus().healthy > 0;
}

boost::asio::awaitable<Result<std::optional<model::TaskList>>>
RoutedStorageBackend::load(std::string key, storage::LoadOptions options, std::stop_token stop) {
    if (auto c = storage::checkCancelled(stop, "load"); !c) {
        co_return c.error();
    }
    auto context = contextFor(options.projectTag);
    context.listId = key;
    auto result = co_await router_->read(key, std::move(context), options);
    if (!result) {
        spdlog::warn("[RoutedStorage] Load of '{}' failed, reporting not found: {}", key,
                     result.error().message);
        co_return std::optional<model::TaskList>{};
    }
    co_return result;
}

boost::asio::awaitable<Result<void>> RoutedStorageBackend::save(std::string key,
                                                                model::TaskList list,
                                                                storage::SaveOptions options,
                                                                std::stop_token stop) {
    if (auto c = storage::checkCancelled(stop, "save"); !c) {
        co_return c;
    }
    auto context = contextFor(list.projectTag.empty() ? std::nullopt
                                                      : std::optional<std::string>(list.projectTag));
    context.listId = key;
    co_return co_await router_->write(std::move(key), std::move(list), std::move(context), options);
}

boost::asio::awaitable<Result<void>> RoutedStorageBackend::remove(std::string key, bool permanent,
                                                                  std::stop_token stop) {
    if (auto c = storage::checkCancelled(stop, "remove"); !c) {
        co_return c;
    }
    co_return co_await router_->remove(std::move(key), permanent);
}

boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
RoutedStorageBackend::list(storage::ListOptions options, std::stop_token stop) {
    if (auto c = storage::checkCancelled(stop, "list"); !c) {
        co_return c.error();
    }

    SearchQuery query;
    query.projectTag = options.projectTag ? options.projectTag : options.context;
    query.includeArchived = options.includeArchived;
    if (options.limit || options.offset) {
        query.pagination = PaginationOptions{options.limit, options.offset};
    }

    auto result = co_await searchSummaries(std::move(query));
    if (!result) {
        co_return result.error();
    }
    co_return std::move(result).value().items;
}

boost::asio::awaitable<Result<SearchResult<model::TaskList>>>
RoutedStorageBackend::search(SearchQuery query) {
    if (router_->isShuttingDown()) {
        co_return Error{ErrorCode::SystemShutdown, "Router is shutting down"};
    }
    auto sources = router_->getActiveSources();
    if (sources.empty()) {
        spdlog::warn("[RoutedStorage] Search with no healthy source");
        co_return SearchResult<model::TaskList>{};
    }
    co_return co_await aggregator_.aggregateLists(std::move(sources), std::move(query));
}

boost::asio::awaitable<Result<SearchResult<model::TaskListSummary>>>
RoutedStorageBackend::searchSummaries(SearchQuery query) {
    if (router_->isShuttingDown()) {
        co_return Error{ErrorCode::SystemShutdown, "Router is shutting down"};
    }
    auto sources = router_->getActiveSources();
    if (sources.empty()) {
        spdlog::warn("[RoutedStorage] Listing with no healthy source");
        co_return SearchResult<model::TaskListSummary>{};
    }
    co_return co_await aggregator_.aggregateSummaries(std::move(sources), std::move(query));
}

boost::asio::awaitable<void> RoutedStorageBackend::shutdown() {
    co_await router_->shutdown();
}

} // namespace taskfed::federation
