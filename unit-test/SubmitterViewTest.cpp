#include "gtest/gtest.h"
#include "server/submitter_view.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server;
using namespace nlohmann;

static test_outcome outcome(size_t index, test_result_kind kind, bool visible) {
    test_outcome test;
    test.index = index;
    test.kind = kind;
    test.out = "out" + to_string(index);
    test.err = "err" + to_string(index);
    test.exit_code = kind == test_result_kind::RUNTIME_ERROR ? 1 : 0;
    test.elapsed = chrono::milliseconds(10);
    test.visible = visible;
    return test;
}

TEST(SubmitterViewTest, HidesOutputOfHiddenTests) {
    submission_result result;
    result.submission_id = "7";
    result.problem = 1;
    result.state = submission_state::COMPLETED;
    result.tests = {outcome(0, test_result_kind::PASS, true), outcome(1, test_result_kind::RUNTIME_ERROR, false)};
    result.elapsed = chrono::milliseconds(30);
    result.remaining_attempts = 2;

    json expected = R"({
        "id": "7",
        "problem": 1,
        "state": "Completed",
        "success": false,
        "time_taken": 30,
        "tests": [
            { "index": 0, "result": "Pass", "visible": true, "time_taken": 10,
              "stdout": "out0", "stderr": "err0", "exit_status": 0 },
            { "index": 1, "result": "Runtime Error", "visible": false, "time_taken": 10 }
        ],
        "passed": 1,
        "failed": 1,
        "percent": 50.0,
        "remaining_attempts": 2
    })"_json;
    EXPECT_JSON_EQ(expected, submitter_view(result, 100));
}

TEST(SubmitterViewTest, TruncatesCompileErrors) {
    submission_result result;
    result.submission_id = "8";
    result.state = submission_state::COMPILE_FAILED;
    result.compile = compile_outcome();
    result.compile->exit_code = 1;
    result.compile->err = string(50, 'e');

    json view = submitter_view(result, 10);
    EXPECT_EQ(view.at("state"), "Compile Failed");
    EXPECT_EQ(view.at("compile").at("success"), false);
    EXPECT_EQ(view.at("compile").at("exit_status"), 1);
    EXPECT_EQ(view.at("compile").at("stderr"), string(10, 'e') + "\n... (truncated)");
    EXPECT_TRUE(view.at("tests").empty());
    EXPECT_EQ(view.at("percent"), 0.0);
    EXPECT_TRUE(view.at("remaining_attempts").is_null());
}

TEST(SubmitterViewTest, Rejection) {
    submission_result result;
    result.submission_id = "9";
    result.state = submission_state::REJECTED;
    result.rejection = rejection_reason::ATTEMPTS_EXHAUSTED;

    json view = submitter_view(result, 100);
    EXPECT_EQ(view.at("state"), "Rejected");
    EXPECT_EQ(view.at("reason"), "No submission attempts remaining");
    EXPECT_FALSE(view.contains("tests"));
}

TEST(SubmitterViewTest, FailureDoesNotLeakDetails) {
    submission_result result;
    result.submission_id = "10";
    result.state = submission_state::FAILED;
    result.failure_reason = "unable to create scratch directory /tmp/arbiter/3f2c";

    json view = submitter_view(result, 100);
    EXPECT_EQ(view.at("state"), "Failed");
    EXPECT_EQ(view.at("reason"), "The submission could not be evaluated");
    EXPECT_EQ(view.dump().find("/tmp/arbiter"), string::npos);
}
