#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<test_result_kind, const char *> test_result_string = boost::assign::map_list_of
    (test_result_kind::PASS, "Pass")
    (test_result_kind::FAIL, "Fail")
    (test_result_kind::TIMEOUT, "Timeout")
    (test_result_kind::RUNTIME_ERROR, "Runtime Error")
    (test_result_kind::RESOURCE_EXCEEDED, "Resource Exceeded");

static const unordered_map<submission_state, const char *> submission_state_string = boost::assign::map_list_of
    (submission_state::QUEUED, "Queued")
    (submission_state::COMPILING, "Compiling")
    (submission_state::COMPILE_FAILED, "Compile Failed")
    (submission_state::RUNNING, "Running")
    (submission_state::COMPLETED, "Completed")
    (submission_state::CANCELLED, "Cancelled")
    (submission_state::FAILED, "Failed")
    (submission_state::REJECTED, "Rejected");

static const unordered_map<rejection_reason, const char *> rejection_string = boost::assign::map_list_of
    (rejection_reason::NONE, "")
    (rejection_reason::ALREADY_IN_FLIGHT, "Submission is already running")
    (rejection_reason::DUPLICATE_ID, "Duplicate submission id")
    (rejection_reason::ATTEMPTS_EXHAUSTED, "No submission attempts remaining")
    (rejection_reason::UNKNOWN_LANGUAGE, "Unknown language")
    (rejection_reason::UNKNOWN_PROBLEM, "Unknown problem")
    (rejection_reason::LANGUAGE_NOT_ALLOWED, "Language is not allowed for this problem")
    (rejection_reason::SHUTTING_DOWN, "Server is shutting down");

static const unordered_map<limit_violation, const char *> violation_string = boost::assign::map_list_of
    (limit_violation::NONE, "")
    (limit_violation::WALL_TIME, "wall-time")
    (limit_violation::CPU_TIME, "cpu-time")
    (limit_violation::MEMORY, "memory")
    (limit_violation::OUTPUT, "output");

static const unordered_map<problem_state, const char *> problem_state_string = boost::assign::map_list_of
    (problem_state::NOT_ATTEMPTED, "NotAttempted")
    (problem_state::IN_PROGRESS, "InProgress")
    (problem_state::PASS, "Pass")
    (problem_state::FAIL, "Fail");
// clang-format on

const char *get_display_message(test_result_kind kind) {
    return test_result_string.at(kind);
}

const char *get_display_message(submission_state state) {
    return submission_state_string.at(state);
}

const char *get_display_message(rejection_reason reason) {
    return rejection_string.at(reason);
}

const char *get_display_message(limit_violation violation) {
    return violation_string.at(violation);
}

const char *get_display_message(problem_state state) {
    return problem_state_string.at(state);
}

bool is_terminal(submission_state state) {
    switch (state) {
        case submission_state::COMPILE_FAILED:
        case submission_state::COMPLETED:
        case submission_state::CANCELLED:
        case submission_state::FAILED:
        case submission_state::REJECTED:
            return true;
        default:
            return false;
    }
}

}  // namespace arbiter
