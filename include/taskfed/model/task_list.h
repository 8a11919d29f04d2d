#pragma once

#include <taskfed/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskfed::model {

enum class TaskStatus { Pending, InProgress, Completed, Blocked, Cancelled };

// Numeric values order tasks by urgency
enum class Priority : int { Minimal = 1, Low = 2, Medium = 3, High = 4, Critical = 5 };

const char* toString(TaskStatus status);
std::optional<TaskStatus> parseTaskStatus(std::string_view value);

/**
 * Individual task inside a list
 */
struct Task {
    std::string id;
    std::string title;
    std::optional<std::string> description;
    TaskStatus status = TaskStatus::Pending;
    Priority priority = Priority::Medium;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;
    std::vector<std::string> dependencies; // ids of tasks this one waits on
    std::optional<int> estimatedDuration;  // minutes
    std::vector<std::string> tags;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Task list: the logical entity persisted by storage backends and reconciled
 * across sources by id.
 */
struct TaskList {
    std::string id;
    std::string title;
    std::optional<std::string> description;
    std::vector<Task> items;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;
    std::string context; // deprecated alias of projectTag
    bool isArchived = false;
    int totalItems = 0;
    int completedItems = 0;
    int progress = 0; // 0-100
    std::string projectTag = "default";
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Lightweight listing record returned by IStorageBackend::list
 */
struct TaskListSummary {
    std::string id;
    std::string title;
    int progress = 0;
    int totalItems = 0;
    int completedItems = 0;
    TimePoint lastUpdated{};
    std::string context;
    std::string projectTag = "default";
    bool isArchived = false;
};

TaskListSummary summarize(const TaskList& list);

// Refresh totalItems/completedItems/progress/completedAt from items
void recomputeProgress(TaskList& list);

// Minimal structural validation applied by backends before persisting
Result<void> validateTaskList(const TaskList& list);

// Highest task priority in the list, 0 when the list has no tasks
int maxTaskPriority(const TaskList& list);

void to_json(nlohmann::json& j, const Task& task);
void from_json(const nlohmann::json& j, Task& task);
void to_json(nlohmann::json& j, const TaskList& list);
void from_json(const nlohmann::json& j, TaskList& list);
void to_json(nlohmann::json& j, const TaskListSummary& summary);
void from_json(const nlohmann::json& j, TaskListSummary& summary);

} // namespace taskfed::model
