#pragma once

#include <taskfed/core/types.h>
#include <taskfed/model/task_list.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskfed::federation {

// Derived list status: completed means progress == 100
enum class ListStatusFilter { Active, Completed, All };

enum class SortField { Title, Status, Priority, CreatedAt, UpdatedAt, CompletedAt, EstimatedDuration };

enum class SortDirection { Asc, Desc };

struct SortOptions {
    SortField field = SortField::UpdatedAt;
    SortDirection direction = SortDirection::Asc;
};

struct PaginationOptions {
    std::optional<size_t> limit;
    std::optional<size_t> offset;
};

struct DateRange {
    TimePoint start{};
    TimePoint end{};
};

/**
 * Multi-source search parameters. Every filter is optional; an empty query
 * matches every non-archived list.
 */
struct SearchQuery {
    std::optional<std::string> text; // case-insensitive substring
    std::optional<std::string> projectTag;
    std::optional<ListStatusFilter> status;
    bool includeArchived = false;

    // Per-task filters: a list matches when any task matches
    std::vector<model::TaskStatus> taskStatus;
    std::vector<model::Priority> taskPriority;
    std::vector<std::string> taskTags;

    std::optional<DateRange> dateRange; // on updatedAt, inclusive
    std::optional<SortOptions> sorting;
    std::optional<PaginationOptions> pagination;
};

struct PaginationInfo {
    size_t offset = 0;
    size_t limit = 0;
};

template <typename T> struct SearchResult {
    std::vector<T> items;
    size_t totalCount = 0; // after filtering, before pagination
    bool hasMore = false;
    std::optional<PaginationInfo> pagination;
};

std::optional<SortField> parseSortField(std::string_view value);
std::optional<ListStatusFilter> parseListStatusFilter(std::string_view value);

} // namespace taskfed::federation
