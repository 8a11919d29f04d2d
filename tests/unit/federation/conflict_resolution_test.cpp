#include <gtest/gtest.h>

#include <taskfed/federation/multi_source_aggregator.h>

#include "common/test_helpers.h"

using namespace taskfed;
using namespace taskfed::federation;
using config::ConflictResolutionStrategy;
using taskfed::tests::at_minutes;
using taskfed::tests::make_list;

namespace {

Sourced<model::TaskList> copyFrom(const std::string& sourceId, int priority,
                                  model::TaskList list) {
    return Sourced<model::TaskList>{std::move(list),
                                    SourceMetadata{sourceId, sourceId, priority, at_minutes(0)}};
}

// Same list "x" on two sources: A (priority 50) newer, B (priority 100) older
std::vector<Sourced<model::TaskList>> twoCopiesOfX() {
    return {copyFrom("A", 50, make_list("x", "from A", at_minutes(10))),
            copyFrom("B", 100, make_list("x", "from B", at_minutes(0)))};
}

} // namespace

TEST(ConflictResolutionTest, LatestPicksMostRecentlyUpdated) {
    auto resolved =
        MultiSourceAggregator::deduplicateAndResolve(twoCopiesOfX(), ConflictResolutionStrategy::Latest);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].title, "from A");
}

TEST(ConflictResolutionTest, PriorityPicksHighestPrioritySource) {
    auto resolved = MultiSourceAggregator::deduplicateAndResolve(
        twoCopiesOfX(), ConflictResolutionStrategy::Priority);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].title, "from B");
}

TEST(ConflictResolutionTest, ManualResolvesLikePriority) {
    auto resolved =
        MultiSourceAggregator::deduplicateAndResolve(twoCopiesOfX(), ConflictResolutionStrategy::Manual);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].title, "from B");
}

TEST(ConflictResolutionTest, MergeResolvesLikeLatest) {
    auto resolved =
        MultiSourceAggregator::deduplicateAndResolve(twoCopiesOfX(), ConflictResolutionStrategy::Merge);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].title, "from A");
}

TEST(ConflictResolutionTest, TiesKeepFirstEncountered) {
    std::vector<Sourced<model::TaskList>> sameTime = {
        copyFrom("A", 10, make_list("x", "first", at_minutes(5))),
        copyFrom("B", 10, make_list("x", "second", at_minutes(5)))};

    auto byLatest = MultiSourceAggregator::deduplicateAndResolve(
        sameTime, ConflictResolutionStrategy::Latest);
    ASSERT_EQ(byLatest.size(), 1u);
    EXPECT_EQ(byLatest[0].title, "first");

    auto byPriority = MultiSourceAggregator::deduplicateAndResolve(
        sameTime, ConflictResolutionStrategy::Priority);
    ASSERT_EQ(byPriority.size(), 1u);
    EXPECT_EQ(byPriority[0].title, "first");
}

TEST(ConflictResolutionTest, OutputKeepsFirstSeenOrderAndUniqueIds) {
    std::vector<Sourced<model::TaskList>> lists = {
        copyFrom("A", 10, make_list("b", "b from A")),
        copyFrom("A", 10, make_list("a", "a from A")),
        copyFrom("B", 20, make_list("c", "c from B")),
        copyFrom("B", 20, make_list("a", "a from B")),
        copyFrom("C", 5, make_list("b", "b from C"))};

    auto resolved =
        MultiSourceAggregator::deduplicateAndResolve(lists, ConflictResolutionStrategy::Priority);
    ASSERT_EQ(resolved.size(), 3u);
    EXPECT_EQ(resolved[0].id, "b");
    EXPECT_EQ(resolved[0].title, "b from A");
    EXPECT_EQ(resolved[1].id, "a");
    EXPECT_EQ(resolved[1].title, "a from B");
    EXPECT_EQ(resolved[2].id, "c");
}

TEST(ConflictResolutionTest, SummariesAlwaysUseSourcePriority) {
    std::vector<Sourced<model::TaskListSummary>> summaries = {
        {model::summarize(make_list("x", "low", at_minutes(30))),
         SourceMetadata{"A", "A", 1, at_minutes(0)}},
        {model::summarize(make_list("x", "high", at_minutes(0))),
         SourceMetadata{"B", "B", 9, at_minutes(0)}},
        {model::summarize(make_list("y", "only")), SourceMetadata{"A", "A", 1, at_minutes(0)}}};

    auto resolved = MultiSourceAggregator::deduplicateSummaries(summaries);
    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_EQ(resolved[0].title, "high");
    EXPECT_EQ(resolved[1].id, "y");
}

TEST(ConflictResolutionTest, StrategyNamesRoundTrip) {
    EXPECT_STREQ(config::toString(ConflictResolutionStrategy::Latest), "latest");
    EXPECT_EQ(config::tryParseConflictResolutionStrategy("merge"), ConflictResolutionStrategy::Merge);
    EXPECT_FALSE(config::tryParseConflictResolutionStrategy("newest").has_value());
    EXPECT_EQ(config::parseConflictResolutionStrategy("newest"), ConflictResolutionStrategy::Priority);
}
