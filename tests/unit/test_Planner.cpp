#include <gtest/gtest.h>
#include "sync/Planner.hpp"
#include "ScriptedDecider.hpp"

using namespace dw::sync;
using namespace dw::sync::model;

namespace {

Classification classified(const std::string& path, const Status s, const bool local = true) {
    Classification c;
    c.path = path;
    c.status = s;
    c.local_exists = local;
    if (s != Status::MISSING) c.remote_timestamp = 1714557600;
    return c;
}

}

class PlannerTest : public ::testing::Test {
protected:
    dw::test::ScriptedDecider decider;
};

TEST_F(PlannerTest, SafeStatusesArePlanned) {
    const auto plan = Planner::build({
        classified("ref", Status::MATCH_REFERENCE),
        classified("local", Status::MATCH_LOCAL),
        classified("dep", Status::MATCH_LAST_DEPLOY),
        classified("new", Status::MISSING),
    }, decider);

    ASSERT_FALSE(plan.aborted);
    ASSERT_EQ(plan.actions.size(), 3u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Overwrite);
    EXPECT_EQ(plan.actions[1].type, ActionType::Overwrite);
    EXPECT_EQ(plan.actions[2].type, ActionType::Create);
    EXPECT_FALSE(plan.actions[2].needsBackup());
    EXPECT_TRUE(plan.actions[0].needsBackup());
    EXPECT_TRUE(decider.asked.empty());
}

TEST_F(PlannerTest, ConflictReplaceAndKeep) {
    decider.choices = {ConflictChoice::Replace, ConflictChoice::Keep};
    const auto plan = Planner::build({
        classified("a", Status::DIFF_HASH),
        classified("b", Status::DIFF_HASH),
    }, decider);

    ASSERT_EQ(plan.actions.size(), 2u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Replace);
    EXPECT_TRUE(plan.actions[0].needsBackup());
    EXPECT_EQ(plan.actions[1].type, ActionType::Inspect);
    EXPECT_FALSE(plan.actions[1].uploads());
    EXPECT_EQ(plan.uploadCount(), 1u);
    EXPECT_EQ(plan.inspectCount(), 1u);
}

TEST_F(PlannerTest, AbortDiscardsEverythingAndStopsAsking) {
    decider.choices = {ConflictChoice::Abort, ConflictChoice::Replace};
    const auto plan = Planner::build({
        classified("safe", Status::MATCH_REFERENCE),
        classified("bad", Status::DIFF_HASH),
        classified("bad2", Status::DIFF_HASH),
    }, decider);

    EXPECT_TRUE(plan.aborted);
    EXPECT_EQ(plan.aborted_on, "bad");
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(decider.asked, std::vector<std::string>{"bad"});
}

TEST_F(PlannerTest, SizeOnlyStatusesNeverParticipate) {
    const auto plan = Planner::build({
        classified("a", Status::MATCH_SIZE),
        classified("b", Status::DIFF_SIZE),
        classified("c", Status::UNKNOWN),
    }, decider);
    EXPECT_TRUE(plan.empty());
    EXPECT_FALSE(plan.aborted);
}

TEST_F(PlannerTest, SafePathsWithoutLocalFileAreNotPlanned) {
    const auto plan = Planner::build({
        classified("gone", Status::MATCH_REFERENCE, false),
        classified("gone2", Status::MISSING, false),
    }, decider);
    EXPECT_TRUE(plan.empty());
    EXPECT_TRUE(decider.asked.empty());
}

TEST_F(PlannerTest, LocallyDeletedDiffHashStillAsksAndAbortCancelsPlan) {
    decider.choices = {ConflictChoice::Abort};
    const auto plan = Planner::build({
        classified("safe.txt", Status::MATCH_REFERENCE),
        classified("deleted.txt", Status::DIFF_HASH, false),
    }, decider);

    EXPECT_EQ(decider.asked, std::vector<std::string>{"deleted.txt"});
    EXPECT_TRUE(plan.aborted);
    EXPECT_EQ(plan.aborted_on, "deleted.txt");
    EXPECT_TRUE(plan.empty());
}

TEST_F(PlannerTest, ReplaceWithoutLocalFileKeepsRemote) {
    decider.choices = {ConflictChoice::Replace};
    auto deleted = classified("deleted.txt", Status::DIFF_HASH, false);
    deleted.remote_size = 42;
    const auto plan = Planner::build({deleted}, decider);

    ASSERT_EQ(plan.actions.size(), 1u);
    EXPECT_EQ(plan.actions[0].type, ActionType::Inspect);
    EXPECT_FALSE(plan.actions[0].uploads());
    EXPECT_EQ(plan.actions[0].remote_size, 42u);
}

TEST_F(PlannerTest, ActionsCarryClassifiedRemoteSize) {
    auto ref = classified("ref", Status::MATCH_REFERENCE);
    ref.remote_size = 7;
    const auto plan = Planner::build({ref, classified("new", Status::MISSING)}, decider);

    ASSERT_EQ(plan.actions.size(), 2u);
    EXPECT_EQ(plan.actions[0].remote_size, 7u);
    EXPECT_FALSE(plan.actions[1].remote_size);
}
