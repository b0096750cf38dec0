#include "server/leaderboard.hpp"
#include <algorithm>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

team_standing compute_standing(const submission_store &store, const string &submitter, size_t problem_count) {
    team_standing standing;
    standing.submitter = submitter;
    standing.states.assign(problem_count, problem_state::NOT_ATTEMPTED);

    for (auto &record : store.latest_results(submitter)) {
        // 历史文件可能来自题目更多的比赛
        if (record.problem >= problem_count) continue;
        standing.states[record.problem] = record.success ? problem_state::PASS : problem_state::FAIL;
        standing.score += record.score;
    }

    for (size_t i = 0; i < problem_count; ++i)
        if (standing.states[i] == problem_state::NOT_ATTEMPTED && store.count_test_runs(submitter, i) > 0)
            standing.states[i] = problem_state::IN_PROGRESS;
    return standing;
}

vector<team_standing> compute_leaderboard(const submission_store &store, size_t problem_count) {
    vector<team_standing> leaderboard;
    for (auto &submitter : store.submitters())
        leaderboard.push_back(compute_standing(store, submitter, problem_count));

    // submitters 已经按名称排序
    stable_sort(leaderboard.begin(), leaderboard.end(),
                [](const team_standing &a, const team_standing &b) { return a.score > b.score; });
    return leaderboard;
}

void to_json(json &j, const team_standing &standing) {
    json states = json::array();
    for (auto state : standing.states) states.push_back(get_display_message(state));
    j = {{"submitter", standing.submitter}, {"score", standing.score}, {"states", states}};
}

}  // namespace arbiter::server
