#pragma once

#include <taskfed/config/data_source_config.h>
#include <taskfed/core/types.h>
#include <taskfed/federation/search_query.h>
#include <taskfed/storage/storage_backend.h>

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace taskfed::federation {

/**
 * A backend taking part in one aggregation call
 */
struct AggregationSource {
    std::shared_ptr<storage::IStorageBackend> backend;
    std::string id;
    std::string name;
    int priority = 0;
};

/**
 * Provenance attached to a fetched record while duplicates are resolved
 */
struct SourceMetadata {
    std::string sourceId;
    std::string sourceName;
    int priority = 0;
    TimePoint fetchedAt{};
};

template <typename T> struct Sourced {
    T value;
    SourceMetadata source;
};

/**
 * @brief Merges task lists from several backends into one result.
 *
 * Pipeline for each call:
 * 1. Fetch from every source (concurrently or one at a time), each source
 *    bounded by queryTimeout. A failing or slow source contributes nothing.
 * 2. Group records by id in first-seen order.
 * 3. Resolve groups with more than one copy using the conflict strategy.
 *    Summaries always resolve by source priority.
 * 4. Filter, sort (stable), paginate.
 *
 * The aggregator holds no state between calls. Only an empty source list is
 * an error (InvalidArgument).
 */
class MultiSourceAggregator {
public:
    explicit MultiSourceAggregator(config::AggregatorConfig config);

    boost::asio::awaitable<Result<SearchResult<model::TaskList>>>
    aggregateLists(std::vector<AggregationSource> sources, SearchQuery query);

    boost::asio::awaitable<Result<SearchResult<model::TaskListSummary>>>
    aggregateSummaries(std::vector<AggregationSource> sources, SearchQuery query);

    const config::AggregatorConfig& getConfig() const { return config_; }

    // Exposed for unit tests; pure functions over already-fetched data.
    static std::vector<model::TaskList>
    deduplicateAndResolve(std::vector<Sourced<model::TaskList>> lists,
                          config::ConflictResolutionStrategy strategy);
    static std::vector<model::TaskListSummary>
    deduplicateSummaries(std::vector<Sourced<model::TaskListSummary>> summaries);

    static bool matches(const model::TaskList& list, const SearchQuery& query);
    static bool matches(const model::TaskListSummary& summary, const SearchQuery& query);

    static void sortLists(std::vector<model::TaskList>& lists, const SortOptions& sorting);
    static void sortSummaries(std::vector<model::TaskListSummary>& summaries,
                              const SortOptions& sorting);

    // Step 1 only: every record fetched, in source order, tagged with the
    // source it came from and the time that source answered.
    boost::asio::awaitable<std::vector<Sourced<model::TaskList>>>
    fetchLists(const std::vector<AggregationSource>& sources, const SearchQuery& query);
    boost::asio::awaitable<std::vector<Sourced<model::TaskListSummary>>>
    fetchSummaries(const std::vector<AggregationSource>& sources, const SearchQuery& query);

private:
    template <typename T>
    using SourceFetch = std::function<boost::asio::awaitable<Result<std::vector<T>>>(
        AggregationSource, std::stop_token)>;

    template <typename T>
    boost::asio::awaitable<std::vector<Sourced<T>>>
    fanOut(const std::vector<AggregationSource>& sources, SourceFetch<T> fetch, const char* what);

    config::AggregatorConfig config_;
};

} // namespace taskfed::federation
