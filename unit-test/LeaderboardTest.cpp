#include "gtest/gtest.h"
#include "judge/scoring.hpp"
#include "server/leaderboard.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server;
using namespace nlohmann;
using arbiter::test::make_submission;

class LeaderboardTest : public ::testing::Test {
protected:
    memory_submission_store store;

    /**
     * @brief 写入一个评测完成的提交，passed / total 个测试点通过
     */
    void finish(const string &id, const string &submitter, size_t problem, size_t passed, size_t total) {
        store.create_pending(make_submission(id, submitter, problem, "sh", ""), nullopt);
        submission_result result;
        result.submission_id = id;
        result.submitter = submitter;
        result.problem = problem;
        result.state = submission_state::COMPLETED;
        for (size_t i = 0; i < total; ++i) {
            test_outcome test;
            test.index = i;
            test.kind = i < passed ? test_result_kind::PASS : test_result_kind::FAIL;
            result.tests.push_back(test);
        }
        store.finalize(result);
    }
};

TEST_F(LeaderboardTest, EmptyHistory) {
    auto standing = compute_standing(store, "alice", 3);
    EXPECT_EQ(standing.submitter, "alice");
    EXPECT_DOUBLE_EQ(standing.score, 0);
    EXPECT_EQ(standing.states, vector<problem_state>(3, problem_state::NOT_ATTEMPTED));
    EXPECT_TRUE(compute_leaderboard(store, 3).empty());
}

TEST_F(LeaderboardTest, StatesFollowLatestSubmission) {
    finish("1", "alice", 0, 2, 2);
    finish("2", "alice", 0, 1, 2);
    finish("3", "alice", 1, 1, 4);
    finish("4", "alice", 1, 4, 4);
    store.record_test_run("alice", 2);
    store.record_test_run("alice", 1);

    auto standing = compute_standing(store, "alice", 4);
    EXPECT_EQ(standing.states, (vector<problem_state>{problem_state::FAIL, problem_state::PASS, problem_state::IN_PROGRESS,
                                                      problem_state::NOT_ATTEMPTED}));
    EXPECT_DOUBLE_EQ(standing.score, 150);
}

TEST_F(LeaderboardTest, UnfinishedSubmissionsDoNotCount) {
    finish("1", "alice", 0, 2, 2);
    store.create_pending(make_submission("2", "alice", 0, "sh", ""), nullopt);
    store.mark_failed("2", "sandbox unavailable");
    store.create_pending(make_submission("3", "alice", 1, "sh", ""), nullopt);

    auto standing = compute_standing(store, "alice", 2);
    EXPECT_EQ(standing.states, (vector<problem_state>{problem_state::PASS, problem_state::NOT_ATTEMPTED}));
    EXPECT_DOUBLE_EQ(standing.score, 100);
}

TEST_F(LeaderboardTest, ProblemsOutsidePacketAreIgnored) {
    finish("1", "alice", 5, 1, 1);
    auto standing = compute_standing(store, "alice", 2);
    EXPECT_EQ(standing.states, vector<problem_state>(2, problem_state::NOT_ATTEMPTED));
    EXPECT_DOUBLE_EQ(standing.score, 0);
}

TEST_F(LeaderboardTest, OrderedByScoreThenName) {
    finish("1", "carol", 0, 1, 2);
    finish("2", "bob", 0, 2, 2);
    finish("3", "alice", 0, 1, 2);
    store.record_test_run("dave", 1);

    auto leaderboard = compute_leaderboard(store, 2);
    ASSERT_EQ(leaderboard.size(), 4u);
    EXPECT_EQ(leaderboard[0].submitter, "bob");
    EXPECT_EQ(leaderboard[1].submitter, "alice");
    EXPECT_EQ(leaderboard[2].submitter, "carol");
    EXPECT_EQ(leaderboard[3].submitter, "dave");
    EXPECT_EQ(leaderboard[3].states, (vector<problem_state>{problem_state::NOT_ATTEMPTED, problem_state::IN_PROGRESS}));
}

TEST_F(LeaderboardTest, Serialization) {
    finish("1", "alice", 1, 1, 1);
    json j = compute_standing(store, "alice", 2);
    EXPECT_EQ(j, (json{{"submitter", "alice"}, {"score", 100.0}, {"states", json::array({"NotAttempted", "Pass"})}}));
}
