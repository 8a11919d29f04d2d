#include <taskfed/core/format.h>
#include <taskfed/core/time_utils.h>
#include <taskfed/model/task_list.h>

#include <algorithm>
#include <stdexcept>

namespace taskfed::model {

namespace {

using nlohmann::json;

json timeToJson(TimePoint tp) {
    return time::formatIso8601(tp);
}

TimePoint timeFromJson(const json& j, const char* field) {
    if (j.is_number_integer()) {
        return time::fromEpochMillis(j.get<int64_t>());
    }
    if (j.is_string()) {
        if (auto tp = time::parseIso8601(j.get<std::string>())) {
            return *tp;
        }
    }
    throw std::invalid_argument(format("invalid timestamp in field '{}'", field));
}

template <typename T>
void readOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

void readOptionalTime(const json& j, const char* key, std::optional<TimePoint>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = timeFromJson(*it, key);
}

TimePoint readTime(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return TimePoint{};
    }
    return timeFromJson(*it, key);
}

Priority priorityFromInt(int value) {
    return static_cast<Priority>(std::clamp(value, 1, 5));
}

} // namespace

const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Blocked: return "blocked";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

std::optional<TaskStatus> parseTaskStatus(std::string_view value) {
    if (value == "pending")
        return TaskStatus::Pending;
    if (value == "in_progress")
        return TaskStatus::InProgress;
    if (value == "completed")
        return TaskStatus::Completed;
    if (value == "blocked")
        return TaskStatus::Blocked;
    if (value == "cancelled")
        return TaskStatus::Cancelled;
    return std::nullopt;
}

TaskListSummary summarize(const TaskList& list) {
    TaskListSummary summary;
    summary.id = list.id;
    summary.title = list.title;
    summary.progress = list.progress;
    summary.totalItems = list.totalItems;
    summary.completedItems = list.completedItems;
    summary.lastUpdated = list.updatedAt;
    summary.context = list.context;
    if (!list.projectTag.empty()) {
        summary.projectTag = list.projectTag;
    } else if (!list.context.empty()) {
        summary.projectTag = list.context;
    }
    summary.isArchived = list.isArchived;
    return summary;
}

void recomputeProgress(TaskList& list) {
    list.totalItems = static_cast<int>(list.items.size());
    list.completedItems = static_cast<int>(
        std::count_if(list.items.begin(), list.items.end(),
                      [](const Task& t) { return t.status == TaskStatus::Completed; }));
    list.progress = list.totalItems == 0 ? 0 : (list.completedItems * 100) / list.totalItems;

    if (list.totalItems > 0 && list.completedItems == list.totalItems) {
        if (!list.completedAt) {
            list.completedAt = list.updatedAt;
        }
    } else {
        list.completedAt.reset();
    }
}

Result<void> validateTaskList(const TaskList& list) {
    if (list.id.empty()) {
        return Error{ErrorCode::ValidationError, "Invalid task list: missing id"};
    }
    if (list.title.empty()) {
        return Error{ErrorCode::ValidationError,
                     format("Invalid task list '{}': missing title", list.id)};
    }
    if (list.progress < 0 || list.progress > 100) {
        return Error{ErrorCode::ValidationError,
                     format("Invalid task list '{}': progress {} out of range", list.id,
                            list.progress)};
    }
    for (const auto& item : list.items) {
        if (item.id.empty()) {
            return Error{ErrorCode::ValidationError,
                         format("Invalid task list '{}': task without id", list.id)};
        }
    }
    return {};
}

int maxTaskPriority(const TaskList& list) {
    int best = 0;
    for (const auto& item : list.items) {
        best = std::max(best, static_cast<int>(item.priority));
    }
    return best;
}

void to_json(nlohmann::json& j, const Task& task) {
    j = json{{"id", task.id},
             {"title", task.title},
             {"status", toString(task.status)},
             {"priority", static_cast<int>(task.priority)},
             {"createdAt", timeToJson(task.createdAt)},
             {"updatedAt", timeToJson(task.updatedAt)},
             {"dependencies", task.dependencies},
             {"tags", task.tags},
             {"metadata", task.metadata}};
    if (task.description)
        j["description"] = *task.description;
    if (task.completedAt)
        j["completedAt"] = timeToJson(*task.completedAt);
    if (task.estimatedDuration)
        j["estimatedDuration"] = *task.estimatedDuration;
}

void from_json(const nlohmann::json& j, Task& task) {
    task.id = j.at("id").get<std::string>();
    task.title = j.value("title", std::string{});
    readOptional(j, "description", task.description);

    auto status = parseTaskStatus(j.value("status", std::string{"pending"}));
    if (!status) {
        throw std::invalid_argument(format("task '{}' has unknown status", task.id));
    }
    task.status = *status;
    task.priority = priorityFromInt(j.value("priority", static_cast<int>(Priority::Medium)));
    task.createdAt = readTime(j, "createdAt");
    task.updatedAt = readTime(j, "updatedAt");
    readOptionalTime(j, "completedAt", task.completedAt);
    task.dependencies = j.value("dependencies", std::vector<std::string>{});
    readOptional(j, "estimatedDuration", task.estimatedDuration);
    task.tags = j.value("tags", std::vector<std::string>{});
    task.metadata = j.value("metadata", json::object());
}

void to_json(nlohmann::json& j, const TaskList& list) {
    j = json{{"id", list.id},
             {"title", list.title},
             {"items", list.items},
             {"createdAt", timeToJson(list.createdAt)},
             {"updatedAt", timeToJson(list.updatedAt)},
             {"context", list.context},
             {"isArchived", list.isArchived},
             {"totalItems", list.totalItems},
             {"completedItems", list.completedItems},
             {"progress", list.progress},
             {"projectTag", list.projectTag},
             {"metadata", list.metadata}};
    if (list.description)
        j["description"] = *list.description;
    if (list.completedAt)
        j["completedAt"] = timeToJson(*list.completedAt);
}

void from_json(const nlohmann::json& j, TaskList& list) {
    list.id = j.at("id").get<std::string>();
    list.title = j.value("title", std::string{});
    readOptional(j, "description", list.description);
    list.items = j.value("items", std::vector<Task>{});
    list.createdAt = readTime(j, "createdAt");
    list.updatedAt = readTime(j, "updatedAt");
    readOptionalTime(j, "completedAt", list.completedAt);
    list.context = j.value("context", std::string{});
    list.isArchived = j.value("isArchived", false);
    list.totalItems = j.value("totalItems", static_cast<int>(list.items.size()));
    list.completedItems = j.value("completedItems", 0);
    list.progress = j.value("progress", 0);
    list.projectTag = j.value("projectTag", list.context.empty() ? std::string{"default"}
                                                                 : list.context);
    list.metadata = j.value("metadata", json::object());
}

void to_json(nlohmann::json& j, const TaskListSummary& summary) {
    j = json{{"id", summary.id},
             {"title", summary.title},
             {"progress", summary.progress},
             {"totalItems", summary.totalItems},
             {"completedItems", summary.completedItems},
             {"lastUpdated", timeToJson(summary.lastUpdated)},
             {"context", summary.context},
             {"projectTag", summary.projectTag},
             {"isArchived", summary.isArchived}};
}

void from_json(const nlohmann::json& j, TaskListSummary& summary) {
    summary.id = j.at("id").get<std::string>();
    summary.title = j.value("title", std::string{});
    summary.progress = j.value("progress", 0);
    summary.totalItems = j.value("totalItems", 0);
    summary.completedItems = j.value("completedItems", 0);
    summary.lastUpdated = readTime(j, "lastUpdated");
    summary.context = j.value("context", std::string{});
    summary.projectTag = j.value("projectTag", std::string{"default"});
    summary.isArchived = j.value("isArchived", false);
}

} // namespace taskfed::model
