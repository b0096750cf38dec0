#include "server/submitter_view.hpp"
#include "common/utils.hpp"
#include "judge/scoring.hpp"

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

json submitter_view(const submission_result &result, size_t max_compile_error) {
    json view = {{"id", result.submission_id},
                 {"problem", result.problem},
                 {"state", get_display_message(result.state)},
                 {"success", result.success()},
                 {"time_taken", result.elapsed.count()}};

    if (result.state == submission_state::REJECTED) {
        view["reason"] = get_display_message(result.rejection);
        return view;
    }
    if (result.state == submission_state::FAILED)
        view["reason"] = "The submission could not be evaluated";

    if (result.compile) {
        view["compile"] = {{"success", result.compile->success},
                           {"exit_status", result.compile->exit_code},
                           {"stderr", truncate_text(result.compile->err, max_compile_error)}};
    }

    json tests = json::array();
    for (auto &test : result.tests) {
        json item = {{"index", test.index},
                     {"result", get_display_message(test.kind)},
                     {"visible", test.visible},
                     {"time_taken", test.elapsed.count()}};
        if (test.visible) {
            item["stdout"] = test.out;
            item["stderr"] = test.err;
            item["exit_status"] = test.exit_code;
        }
        tests.push_back(move(item));
    }
    view["tests"] = move(tests);
    view["passed"] = result.passed_count();
    view["failed"] = result.tests.size() - result.passed_count();
    view["percent"] = to_percentage(result.score());
    if (result.remaining_attempts)
        view["remaining_attempts"] = *result.remaining_attempts;
    else
        view["remaining_attempts"] = nullptr;
    return view;
}

}  // namespace arbiter::server
