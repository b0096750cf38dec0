#include "judge/scoring.hpp"

namespace arbiter {
using namespace std;

boost::rational<int> compute_score(const vector<test_outcome> &tests) {
    int passed = 0, total = 0;
    for (auto &test : tests) {
        total += test.weight;
        if (test.kind == test_result_kind::PASS) passed += test.weight;
    }
    if (total == 0) return 0;
    return boost::rational<int>(passed, total);
}

bool compute_success(const optional<compile_outcome> &compile, const vector<test_outcome> &tests) {
    if (compile && !compile->success) return false;
    if (tests.empty()) return false;
    return compute_score(tests) == 1;
}

double to_percentage(const boost::rational<int> &score) {
    return boost::rational_cast<double>(score) * 100;
}

boost::rational<int> submission_result::score() const {
    if (state != submission_state::COMPLETED) return 0;
    return compute_score(tests);
}

bool submission_result::success() const {
    return state == submission_state::COMPLETED && compute_success(compile, tests);
}

size_t submission_result::passed_count() const {
    size_t passed = 0;
    for (auto &test : tests)
        if (test.kind == test_result_kind::PASS) ++passed;
    return passed;
}

}  // namespace arbiter
