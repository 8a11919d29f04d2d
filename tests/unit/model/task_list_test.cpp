#include <gtest/gtest.h>

#include <taskfed/model/task_list.h>

#include "common/test_helpers.h"

using namespace taskfed;
using namespace taskfed::model;
using taskfed::tests::make_list;
using taskfed::tests::make_task;

TEST(TaskListTest, RecomputeProgressCountsCompletedTasks) {
    auto list = make_list("l1", "Sprint");
    list.items = {make_task("a", TaskStatus::Completed), make_task("b"), make_task("c"),
                  make_task("d", TaskStatus::Completed)};
    recomputeProgress(list);

    EXPECT_EQ(list.totalItems, 4);
    EXPECT_EQ(list.completedItems, 2);
    EXPECT_EQ(list.progress, 50);
    EXPECT_FALSE(list.completedAt.has_value());
}

TEST(TaskListTest, RecomputeProgressMarksFullyCompletedList) {
    auto list = make_list("l1", "Done", taskfed::tests::at_minutes(5));
    list.items = {make_task("a", TaskStatus::Completed)};
    recomputeProgress(list);

    EXPECT_EQ(list.progress, 100);
    ASSERT_TRUE(list.completedAt.has_value());
    EXPECT_EQ(*list.completedAt, list.updatedAt);

    list.items.push_back(make_task("b"));
    recomputeProgress(list);
    EXPECT_EQ(list.progress, 50);
    EXPECT_FALSE(list.completedAt.has_value());
}

TEST(TaskListTest, EmptyListHasZeroProgress) {
    auto list = make_list("l1", "Empty");
    recomputeProgress(list);
    EXPECT_EQ(list.totalItems, 0);
    EXPECT_EQ(list.progress, 0);
}

TEST(TaskListTest, ValidateRejectsMissingFields) {
    auto list = make_list("", "No id");
    auto r = validateTaskList(list);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    list = make_list("l1", "");
    EXPECT_FALSE(validateTaskList(list));

    list = make_list("l1", "Title");
    list.progress = 101;
    EXPECT_FALSE(validateTaskList(list));

    list = make_list("l1", "Title");
    list.items.push_back(make_task(""));
    EXPECT_FALSE(validateTaskList(list));

    list.items.back().id = "t1";
    EXPECT_TRUE(validateTaskList(list));
}

TEST(TaskListTest, MaxTaskPriority) {
    auto list = make_list("l1", "Mixed");
    EXPECT_EQ(maxTaskPriority(list), 0);

    list.items = {make_task("a", TaskStatus::Pending, Priority::Low),
                  make_task("b", TaskStatus::Pending, Priority::Critical),
                  make_task("c", TaskStatus::Pending, Priority::Medium)};
    EXPECT_EQ(maxTaskPriority(list), 5);
}

TEST(TaskListTest, SummarizeCopiesListingFields) {
    auto list = make_list("l1", "Sprint", taskfed::tests::at_minutes(30), "web");
    list.items = {make_task("a", TaskStatus::Completed), make_task("b")};
    recomputeProgress(list);
    list.isArchived = true;

    auto summary = summarize(list);
    EXPECT_EQ(summary.id, "l1");
    EXPECT_EQ(summary.title, "Sprint");
    EXPECT_EQ(summary.progress, 50);
    EXPECT_EQ(summary.totalItems, 2);
    EXPECT_EQ(summary.completedItems, 1);
    EXPECT_EQ(summary.lastUpdated, list.updatedAt);
    EXPECT_EQ(summary.projectTag, "web");
    EXPECT_TRUE(summary.isArchived);
}

TEST(TaskListTest, SummarizeFallsBackToContextForProjectTag) {
    auto list = make_list("l1", "Legacy");
    list.projectTag.clear();
    list.context = "legacy-project";
    EXPECT_EQ(summarize(list).projectTag, "legacy-project");
}

TEST(TaskListJsonTest, RoundTripPreservesFields) {
    auto list = make_list("l1", "Release", taskfed::tests::at_minutes(90), "api");
    list.description = "Ship 1.0";
    auto task = make_task("t1", TaskStatus::InProgress, Priority::High, {"backend"});
    task.estimatedDuration = 45;
    task.dependencies = {"t0"};
    list.items = {task};
    recomputeProgress(list);

    nlohmann::json j = list;
    EXPECT_EQ(j["updatedAt"], "2024-05-01T13:30:00.000Z");
    EXPECT_EQ(j["items"][0]["status"], "in_progress");

    auto parsed = j.get<TaskList>();
    EXPECT_EQ(parsed.id, "l1");
    EXPECT_EQ(parsed.description, std::optional<std::string>("Ship 1.0"));
    EXPECT_EQ(parsed.updatedAt, list.updatedAt);
    EXPECT_EQ(parsed.projectTag, "api");
    ASSERT_EQ(parsed.items.size(), 1u);
    EXPECT_EQ(parsed.items[0].priority, Priority::High);
    EXPECT_EQ(parsed.items[0].estimatedDuration, std::optional<int>(45));
    EXPECT_EQ(parsed.items[0].tags, std::vector<std::string>{"backend"});
}

TEST(TaskListJsonTest, AcceptsEpochMillisecondTimestamps) {
    auto j = nlohmann::json::parse(R"({"id":"l1","title":"T","updatedAt":1714564800000})");
    auto list = j.get<TaskList>();
    EXPECT_EQ(list.updatedAt, taskfed::tests::base_time());
}

TEST(TaskListJsonTest, ProjectTagDefaultsFromContext) {
    auto withContext = nlohmann::json::parse(R"({"id":"l1","title":"T","context":"ops"})");
    EXPECT_EQ(withContext.get<TaskList>().projectTag, "ops");

    auto bare = nlohmann::json::parse(R"({"id":"l2","title":"T"})");
    EXPECT_EQ(bare.get<TaskList>().projectTag, "default");
}

TEST(TaskListJsonTest, RejectsBadValues) {
    auto badTime = nlohmann::json::parse(R"({"id":"l1","title":"T","updatedAt":"yesterday"})");
    EXPECT_THROW(badTime.get<TaskList>(), std::invalid_argument);

    auto badStatus = nlohmann::json::parse(
        R"({"id":"l1","title":"T","items":[{"id":"t1","status":"sleeping"}]})");
    EXPECT_THROW(badStatus.get<TaskList>(), std::invalid_argument);
}

TEST(TaskListJsonTest, PriorityIsClamped) {
    auto j = nlohmann::json::parse(
        R"({"id":"l1","title":"T","items":[{"id":"a","priority":9},{"id":"b","priority":0}]})");
    auto list = j.get<TaskList>();
    EXPECT_EQ(list.items[0].priority, Priority::Critical);
    EXPECT_EQ(list.items[1].priority, Priority::Minimal);
}
