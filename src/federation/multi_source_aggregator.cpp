#include <taskfed/core/format.h>
#include <taskfed/federation/multi_source_aggregator.h>
#include <taskfed/federation/with_timeout.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace taskfed::federation {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsIgnoreCase(std::string_view haystack, const std::string& loweredNeedle) {
    return toLower(haystack).find(loweredNeedle) != std::string::npos;
}

bool matchesStatus(int progress, const std::optional<ListStatusFilter>& status) {
    if (!status || *status == ListStatusFilter::All) {
        return true;
    }
    if (*status == ListStatusFilter::Completed) {
        return progress == 100;
    }
    return progress != 100;
}

storage::ListOptions listOptionsFor(const SearchQuery& query) {
    storage::ListOptions options;
    options.includeArchived = query.includeArchived;
    options.projectTag = query.projectTag;
    return options;
}

// Summaries, then each full list. A list that fails or throws on load is skipped.
boost::asio::awaitable<Result<std::vector<model::TaskList>>>
fetchSourceLists(AggregationSource source, SearchQuery query, std::stop_token stop) {
    auto summaries = co_await source.backend->list(listOptionsFor(query), stop);
    if (!summaries) {
        co_return summaries.error();
    }

    std::vector<model::TaskList> lists;
    lists.reserve(summaries.value().size());
    for (const auto& summary : summaries.value()) {
        if (stop.stop_requested()) {
            co_return Error{ErrorCode::OperationCancelled,
                            format("fetch from '{}' cancelled", source.id)};
        }
        storage::LoadOptions loadOptions;
        loadOptions.includeArchived = query.includeArchived;
        std::optional<Result<std::optional<model::TaskList>>> loaded;
        try {
            loaded.emplace(co_await source.backend->load(summary.id, loadOptions, stop));
        } catch (const std::exception& e) {
            spdlog::warn("[MultiSourceAggregator] Loading '{}' from source '{}' threw: {}",
                         summary.id, source.id, e.what());
            continue;
        }
        if (!*loaded) {
            spdlog::warn("[MultiSourceAggregator] Failed to load '{}' from source '{}': {}",
                         summary.id, source.id, loaded->error().message);
            continue;
        }
        if (loaded->value()) {
            lists.push_back(std::move(*loaded->value()));
        }
    }
    co_return lists;
}

boost::asio::awaitable<Result<std::vector<model::TaskListSummary>>>
fetchSourceSummaries(AggregationSource source, SearchQuery query, std::stop_token stop) {
    co_return co_await source.backend->list(listOptionsFor(query), stop);
}

// One source's answer and when it arrived.
template <typename T> struct FetchOutcome {
    Result<std::vector<T>> result;
    TimePoint fetchedAt;
};

template <typename T> struct FanOutState {
    FanOutState(const boost::asio::any_io_executor& ex, size_t count)
        : signal(ex), pending(count), slots(count) {
        signal.expires_at(boost::asio::steady_timer::time_point::max());
    }

    boost::asio::steady_timer signal;
    size_t pending;
    std::vector<std::optional<FetchOutcome<T>>> slots;
};

template <typename T>
std::vector<T> paginate(std::vector<T> items, const std::optional<PaginationOptions>& pagination) {
    if (!pagination) {
        return items;
    }
    size_t offset = std::min(pagination->offset.value_or(0), items.size());
    size_t limit = pagination->limit.value_or(items.size());
    size_t end = std::min(items.size(), offset + std::min(limit, items.size() - offset));
    return std::vector<T>(std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(offset)),
                          std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(end)));
}

template <typename T>
SearchResult<T> finish(std::vector<T> filtered, const SearchQuery& query) {
    SearchResult<T> result;
    result.totalCount = filtered.size();
    result.items = paginate(std::move(filtered), query.pagination);

    size_t offset = query.pagination ? query.pagination->offset.value_or(0) : 0;
    result.hasMore = offset + result.items.size() < result.totalCount;
    if (query.pagination) {
        result.pagination = PaginationInfo{offset, query.pagination->limit.value_or(result.totalCount)};
    }
    return result;
}

template <typename T, typename Key>
void stableSortBy(std::vector<T>& items, SortDirection direction, Key key) {
    if (direction == SortDirection::Asc) {
        std::stable_sort(items.begin(), items.end(),
                         [&](const T& a, const T& b) { return key(a) < key(b); });
    } else {
        std::stable_sort(items.begin(), items.end(),
                         [&](const T& a, const T& b) { return key(b) < key(a); });
    }
}

} // namespace

std::optional<SortField> parseSortField(std::string_view value) {
    if (value == "title")
        return SortField::Title;
    if (value == "status")
        return SortField::Status;
    if (value == "priority")
        return SortField::Priority;
    if (value == "createdAt")
        return SortField::CreatedAt;
    if (value == "updatedAt")
        return SortField::UpdatedAt;
    if (value == "completedAt")
        return SortField::CompletedAt;
    if (value == "estimatedDuration")
        return SortField::EstimatedDuration;
    return std::nullopt;
}

std::optional<ListStatusFilter> parseListStatusFilter(std::string_view value) {
    if (value == "active")
        return ListStatusFilter::Active;
    if (value == "completed")
        return ListStatusFilter::Completed;
    if (value == "all")
        return ListStatusFilter::All;
    return std::nullopt;
}

MultiSourceAggregator::MultiSourceAggregator(config::AggregatorConfig config) : config_(config) {
    spdlog::info("[MultiSourceAggregator] Created (conflictResolution={}, parallelQueries={})",
                 config::toString(config_.conflictResolution), config_.parallelQueries);
}

template <typename T>
boost::asio::awaitable<std::vector<Sourced<T>>>
MultiSourceAggregator::fanOut(const std::vector<AggregationSource>& sources, SourceFetch<T> fetch,
                              const char* what) {
    const Duration timeout = config_.queryTimeout;
    auto runOne = [fetch, timeout, what](const AggregationSource& source)
        -> boost::asio::awaitable<Result<std::vector<T>>> {
        StoppableOp<std::vector<T>> op = [fetch, source](std::stop_token stop) {
            return fetch(source, stop);
        };
        return runWithTimeout<std::vector<T>>(timeout, std::move(op),
                                              format("{} from source '{}'", what, source.id));
    };

    std::vector<std::optional<FetchOutcome<T>>> outcomes(sources.size());

    if (config_.parallelQueries) {
        auto executor = co_await boost::asio::this_coro::executor;
        auto state = std::make_shared<FanOutState<T>>(executor, sources.size());
        for (size_t i = 0; i < sources.size(); ++i) {
            boost::asio::co_spawn(
                executor,
                [state, i, source = sources[i], runOne]() -> boost::asio::awaitable<void> {
                    auto r = co_await runOne(source);
                    state->slots[i].emplace(
                        FetchOutcome<T>{std::move(r), std::chrono::system_clock::now()});
                    if (--state->pending == 0) {
                        state->signal.cancel();
                    }
                },
                boost::asio::detached);
        }
        if (state->pending > 0) {
            boost::system::error_code ec;
            co_await state->signal.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        outcomes = std::move(state->slots);
    } else {
        for (size_t i = 0; i < sources.size(); ++i) {
            auto r = co_await runOne(sources[i]);
            outcomes[i].emplace(FetchOutcome<T>{std::move(r), std::chrono::system_clock::now()});
        }
    }

    std::vector<Sourced<T>> out;
    for (size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        auto& outcome = outcomes[i];
        if (!outcome || !outcome->result) {
            spdlog::warn("[MultiSourceAggregator] Source '{}' contributed nothing: {}", source.id,
                         outcome ? outcome->result.error().message : std::string("no result"));
            continue;
        }
        for (auto& item : outcome->result.value()) {
            out.push_back(Sourced<T>{std::move(item),
                                     SourceMetadata{source.id, source.name, source.priority,
                                                    outcome->fetchedAt}});
        }
    }
    co_return out;
}

boost::asio::awaitable<std::vector<Sourced<model::TaskList>>>
MultiSourceAggregator::fetchLists(const std::vector<AggregationSource>& sources,
                                  const SearchQuery& query) {
    SourceFetch<model::TaskList> fetch = [query](AggregationSource source, std::stop_token stop) {
        return fetchSourceLists(std::move(source), query, stop);
    };
    co_return co_await fanOut<model::TaskList>(sources, std::move(fetch), "lists");
}

boost::asio::awaitable<std::vector<Sourced<model::TaskListSummary>>>
MultiSourceAggregator::fetchSummaries(const std::vector<AggregationSource>& sources,
                                      const SearchQuery& query) {
    SourceFetch<model::TaskListSummary> fetch = [query](AggregationSource source,
                                                        std::stop_token stop) {
        return fetchSourceSummaries(std::move(source), query, stop);
    };
    co_return co_await fanOut<model::TaskListSummary>(sources, std::move(fetch), "summaries");
}

boost::asio::awaitable<Result<SearchResult<model::TaskList>>>
MultiSourceAggregator::aggregateLists(std::vector<AggregationSource> sources, SearchQuery query) {
    if (sources.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "No sources to aggregate"};
    }
    spdlog::debug("[MultiSourceAggregator] Aggregating lists from {} sources", sources.size());

    auto fetched = co_await fetchLists(sources, query);
    const size_t fetchedCount = fetched.size();
    auto resolved = deduplicateAndResolve(std::move(fetched), config_.conflictResolution);
    spdlog::debug("[MultiSourceAggregator] Deduplicated {} lists to {}", fetchedCount,
                  resolved.size());

    std::vector<model::TaskList> filtered;
    filtered.reserve(resolved.size());
    for (auto& list : resolved) {
        if (matches(list, query)) {
            filtered.push_back(std::move(list));
        }
    }
    if (query.sorting) {
        sortLists(filtered, *query.sorting);
    }

    auto result = finish(std::move(filtered), query);
    spdlog::info("[MultiSourceAggregator] Aggregation complete: {} of {} lists (hasMore={})",
                 result.items.size(), result.totalCount, result.hasMore);
    co_return result;
}

boost::asio::awaitable<Result<SearchResult<model::TaskListSummary>>>
MultiSourceAggregator::aggregateSummaries(std::vector<AggregationSource> sources,
                                          SearchQuery query) {
    if (sources.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "No sources to aggregate"};
    }
    spdlog::debug("[MultiSourceAggregator] Aggregating summaries from {} sources",
                  sources.size());

    auto resolved = deduplicateSummaries(co_await fetchSummaries(sources, query));

    std::vector<model::TaskListSummary> filtered;
    filtered.reserve(resolved.size());
    for (auto& summary : resolved) {
        if (matches(summary, query)) {
            filtered.push_back(std::move(summary));
        }
    }
    if (query.sorting) {
        sortSummaries(filtered, *query.sorting);
    }

    auto result = finish(std::move(filtered), query);
    spdlog::info("[MultiSourceAggregator] Summary aggregation complete: {} of {} (hasMore={})",
                 result.items.size(), result.totalCount, result.hasMore);
    co_return result;
}

std::vector<model::TaskList>
MultiSourceAggregator::deduplicateAndResolve(std::vector<Sourced<model::TaskList>> lists,
                                             config::ConflictResolutionStrategy strategy) {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < lists.size(); ++i) {
        auto [it, inserted] = groups.try_emplace(lists[i].value.id);
        if (inserted) {
            order.push_back(lists[i].value.id);
        }
        it->second.push_back(i);
    }

    using config::ConflictResolutionStrategy;
    auto byLatest = [&](const std::vector<size_t>& members) {
        size_t best = members.front();
        for (size_t idx : members) {
            if (lists[idx].value.updatedAt > lists[best].value.updatedAt) {
                best = idx;
            }
        }
        return best;
    };
    auto byPriority = [&](const std::vector<size_t>& members) {
        size_t best = members.front();
        for (size_t idx : members) {
            if (lists[idx].source.priority > lists[best].source.priority) {
                best = idx;
            }
        }
        return best;
    };

    std::vector<model::TaskList> resolved;
    resolved.reserve(order.size());
    for (const auto& id : order) {
        const auto& members = groups[id];
        size_t chosen = members.front();
        if (members.size() > 1) {
            switch (strategy) {
                case ConflictResolutionStrategy::Latest:
                    chosen = byLatest(members);
                    break;
                case ConflictResolutionStrategy::Priority:
                    chosen = byPriority(members);
                    break;
                case ConflictResolutionStrategy::Manual:
                    spdlog::warn("[MultiSourceAggregator] Manual conflict resolution not "
                                 "implemented for '{}', using priority",
                                 id);
                    chosen = byPriority(members);
                    break;
                case ConflictResolutionStrategy::Merge:
                    spdlog::warn("[MultiSourceAggregator] Merge conflict resolution not "
                                 "implemented for '{}', using latest",
                                 id);
                    chosen = byLatest(members);
                    break;
            }
            spdlog::debug("[MultiSourceAggregator] Resolved {} copies of '{}' to source '{}' ({})",
                          members.size(), id, lists[chosen].source.sourceId,
                          config::toString(strategy));
        }
        resolved.push_back(std::move(lists[chosen].value));
    }
    return resolved;
}

std::vector<model::TaskListSummary>
MultiSourceAggregator::deduplicateSummaries(std::vector<Sourced<model::TaskListSummary>> summaries) {
    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> best;
    for (size_t i = 0; i < summaries.size(); ++i) {
        const auto& id = summaries[i].value.id;
        auto [it, inserted] = best.try_emplace(id, i);
        if (inserted) {
            order.push_back(id);
        } else if (summaries[i].source.priority > summaries[it->second].source.priority) {
            it->second = i;
        }
    }

    std::vector<model::TaskListSummary> out;
    out.reserve(order.size());
    for (const auto& id : order) {
        out.push_back(std::move(summaries[best[id]].value));
    }
    return out;
}

bool MultiSourceAggregator::matches(const model::TaskList& list, const SearchQuery& query) {
    if (query.text && !query.text->empty()) {
        auto needle = toLower(*query.text);
        bool hit = containsIgnoreCase(list.title, needle) ||
                   (list.description && containsIgnoreCase(*list.description, needle));
        if (!hit) {
            return false;
        }
    }
    if (query.projectTag && list.projectTag != *query.projectTag) {
        return false;
    }
    if (!matchesStatus(list.progress, query.status)) {
        return false;
    }
    if (!query.taskStatus.empty()) {
        bool any = std::any_of(list.items.begin(), list.items.end(), [&](const model::Task& t) {
            return std::find(query.taskStatus.begin(), query.taskStatus.end(), t.status) !=
                   query.taskStatus.end();
        });
        if (!any) {
            return false;
        }
    }
    if (!query.taskPriority.empty()) {
        bool any = std::any_of(list.items.begin(), list.items.end(), [&](const model::Task& t) {
            return std::find(query.taskPriority.begin(), query.taskPriority.end(), t.priority) !=
                   query.taskPriority.end();
        });
        if (!any) {
            return false;
        }
    }
    if (!query.taskTags.empty()) {
        bool any = std::any_of(list.items.begin(), list.items.end(), [&](const model::Task& t) {
            return std::any_of(query.taskTags.begin(), query.taskTags.end(),
                               [&](const std::string& tag) {
                                   return std::find(t.tags.begin(), t.tags.end(), tag) !=
                                          t.tags.end();
                               });
        });
        if (!any) {
            return false;
        }
    }
    if (query.dateRange &&
        (list.updatedAt < query.dateRange->start || list.updatedAt > query.dateRange->end)) {
        return false;
    }
    return true;
}

bool MultiSourceAggregator::matches(const model::TaskListSummary& summary,
                                    const SearchQuery& query) {
    if (query.text && !query.text->empty() &&
        !containsIgnoreCase(summary.title, toLower(*query.text))) {
        return false;
    }
    return matchesStatus(summary.progress, query.status);
}

void MultiSourceAggregator::sortLists(std::vector<model::TaskList>& lists,
                                      const SortOptions& sorting) {
    using model::TaskList;
    switch (sorting.field) {
        case SortField::Title:
            stableSortBy(lists, sorting.direction, [](const TaskList& l) -> const std::string& { return l.title; });
            break;
        case SortField::CreatedAt:
            stableSortBy(lists, sorting.direction, [](const TaskList& l) { return l.createdAt; });
            break;
        case SortField::UpdatedAt:
            stableSortBy(lists, sorting.direction, [](const TaskList& l) { return l.updatedAt; });
            break;
        case SortField::CompletedAt:
            stableSortBy(lists, sorting.direction,
                         [](const TaskList& l) { return l.completedAt.value_or(TimePoint{}); });
            break;
        case SortField::Priority:
            stableSortBy(lists, sorting.direction,
                         [](const TaskList& l) { return model::maxTaskPriority(l); });
            break;
        case SortField::Status:
            stableSortBy(lists, sorting.direction, [](const TaskList& l) { return l.progress; });
            break;
        case SortField::EstimatedDuration:
            break;
    }
}

void MultiSourceAggregator::sortSummaries(std::vector<model::TaskListSummary>& summaries,
                                          const SortOptions& sorting) {
    using model::TaskListSummary;
    switch (sorting.field) {
        case SortField::Title:
            stableSortBy(summaries, sorting.direction,
                         [](const TaskListSummary& s) -> const std::string& { return s.title; });
            break;
        case SortField::UpdatedAt:
            stableSortBy(summaries, sorting.direction,
                         [](const TaskListSummary& s) { return s.lastUpdated; });
            break;
        case SortField::Status:
            stableSortBy(summaries, sorting.direction,
                         [](const TaskListSummary& s) { return s.progress; });
            break;
        default:
            break;
    }
}

} // namespace taskfed::federation
