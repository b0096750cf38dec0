#include "judge/test_executor.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

string normalize_output(const string &text, bool trim) {
    if (!trim) return text;
    return boost::algorithm::trim_copy(text);
}

test_result_kind classify(const sandbox::execution_report &report, const string &expected, bool trim) {
    switch (report.violation) {
        case limit_violation::WALL_TIME:
        case limit_violation::CPU_TIME:
            return test_result_kind::TIMEOUT;
        case limit_violation::MEMORY:
        case limit_violation::OUTPUT:
            return test_result_kind::RESOURCE_EXCEEDED;
        case limit_violation::NONE:
            break;
    }

    if (!report.spawned || report.signal != 0 || report.exit_code != 0)
        return test_result_kind::RUNTIME_ERROR;

    if (normalize_output(report.out.data, trim) == normalize_output(expected, trim))
        return test_result_kind::PASS;
    else
        return test_result_kind::FAIL;
}

test_outcome run_test(const language_runner &runner, const artifact &program, const test_case &test, size_t index,
                      const sandbox::cancellation_token *cancel) {
    auto report = runner.execute(program, test.input, cancel);
    if (!report.spawned)
        throw sandbox_error(fmt::format("unable to start program of language {}: {}", program.lang.name, report.spawn_error));

    test_outcome outcome;
    outcome.index = index;
    outcome.kind = classify(report, test.output, runner.limits().trim_output);
    outcome.out = move(report.out.data);
    outcome.err = move(report.err.data);
    outcome.exit_code = report.exit_code;
    outcome.elapsed = report.wall_time;
    outcome.visible = test.visible;
    outcome.weight = test.weight;
    return outcome;
}

}  // namespace arbiter
