#include "judge/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/scoring.hpp"
#include "judge/test_executor.hpp"
#include "server/leaderboard.hpp"

namespace arbiter {
using namespace std;

submission_pipeline::submission_pipeline(const server::competition_config &config, const language_runner &runner,
                                         submission_registry &registry, server::submission_store &store,
                                         server::event_publisher &events)
    : config(config), runner(runner), registry(registry), store(store), events(events) {}

submission_result submission_pipeline::submit(const submission &submit) {
    return evaluate(submit, admission_kind::SUBMISSION);
}

submission_result submission_pipeline::run_tests(const submission &submit) {
    return evaluate(submit, admission_kind::TEST_RUN);
}

void submission_pipeline::shutdown() {
    stopping = true;
    registry.cancel_all();
}

bool submission_pipeline::is_shutting_down() const {
    return stopping;
}

submission_registry &submission_pipeline::live() const {
    return registry;
}

optional<int> submission_pipeline::remaining_attempts(const submission &submit) const {
    if (!config.max_submissions) return nullopt;
    return max(0, *config.max_submissions - store.count_attempts(submit.submitter, submit.problem));
}

static submission_result rejected(submission_result result, rejection_reason reason) {
    result.state = submission_state::REJECTED;
    result.rejection = reason;
    return result;
}

submission_result submission_pipeline::evaluate(const submission &submit, admission_kind kind) {
    elapsed_time timer;
    bool is_submission = kind == admission_kind::SUBMISSION;

    submission_result result;
    result.submission_id = submit.id;
    result.submitter = submit.submitter;
    result.problem = submit.problem;

    if (stopping) return rejected(move(result), rejection_reason::SHUTTING_DOWN);

    const server::problem *prob = config.find_problem(submit.problem);
    if (!prob) return rejected(move(result), rejection_reason::UNKNOWN_PROBLEM);
    const language *lang = config.find_language(submit.language);
    if (!lang) return rejected(move(result), rejection_reason::UNKNOWN_LANGUAGE);
    if (!prob->allows(submit.language)) return rejected(move(result), rejection_reason::LANGUAGE_NOT_ALLOWED);

    vector<test_case> tests = is_submission ? prob->tests : prob->visible_tests();

    rejection_reason reason;
    auto registration = registry.admit(submit, kind, tests.size(), reason);
    if (!registration) {
        LOG(INFO) << submit << " rejected: " << get_display_message(reason);
        return rejected(move(result), reason);
    }

    // 持有 registration 期间同一选手同一题目不会有其他提交，检查次数和写入记录之间没有竞争。
    // registry 只拒绝正在评测的 id，已经结束的 id 需要查询历史记录
    if (is_submission) {
        if (store.find(submit.id)) {
            LOG(INFO) << submit << " rejected: " << get_display_message(rejection_reason::DUPLICATE_ID);
            return rejected(move(result), rejection_reason::DUPLICATE_ID);
        }

        auto remaining = remaining_attempts(submit);
        if (remaining && *remaining <= 0) {
            LOG(INFO) << submit << " rejected: " << get_display_message(rejection_reason::ATTEMPTS_EXHAUSTED);
            result.remaining_attempts = 0;
            return rejected(move(result), rejection_reason::ATTEMPTS_EXHAUSTED);
        }
        events.publish(server::submission_queued{submit.id, submit.submitter, submit.problem, chrono::system_clock::now()});
    }

    live_entry &entry = registration.entry();
    LOG(INFO) << submit << (is_submission ? " queued" : " test run queued") << ", language " << lang->name << ", " << tests.size() << " tests";

    bool pending = false;
    try {
        entry.state = submission_state::COMPILING;
        auto program = runner.materialize(*lang, submit.source);

        if (lang->is_compiled()) {
            result.compile = runner.build(*program, &entry.cancel);
            LOG(INFO) << submit << " compiled, exit code " << result.compile->exit_code;
        }

        if (entry.cancel.is_cancelled()) {
            result.state = submission_state::CANCELLED;
        } else {
            if (is_submission) {
                store.create_pending(submit, result.compile);
                pending = true;
            }

            if (result.compile && !result.compile->success) {
                result.state = submission_state::COMPILE_FAILED;
            } else {
                entry.state = submission_state::RUNNING;
                auto outcomes = run_all(*program, tests, entry);
                if (entry.cancel.is_cancelled()) {
                    result.state = submission_state::CANCELLED;
                } else {
                    result.tests = move(outcomes);
                    result.state = submission_state::COMPLETED;
                }
            }
        }
    } catch (sandbox_error &e) {
        LOG(ERROR) << submit << " failed: " << e.what();
        result.state = submission_state::FAILED;
        result.failure_reason = e.what();
    } catch (system_error &e) {
        LOG(ERROR) << submit << " failed: " << e.what();
        result.state = submission_state::FAILED;
        result.failure_reason = e.what();
    }

    // 取消或者失败的提交不保留任何测试点结果
    if (result.state == submission_state::CANCELLED || result.state == submission_state::FAILED)
        result.tests.clear();

    result.elapsed = timer.duration<chrono::milliseconds>();

    if (is_submission) {
        if (pending) save_result(result);
    } else if (result.state == submission_state::COMPLETED || result.state == submission_state::COMPILE_FAILED) {
        try {
            store.record_test_run(submit.submitter, submit.problem);
        } catch (system_error &e) {
            LOG(ERROR) << submit << " test run not recorded: " << e.what();
        }
    }
    entry.state = result.state;
    result.remaining_attempts = remaining_attempts(submit);

    LOG(INFO) << submit << " finished: " << get_display_message(result.state)
              << fmt::format(", {}/{} tests passed, {}ms", result.passed_count(), result.tests.size(), result.elapsed.count());

    registration.release();
    publish_result(result, kind, *prob);
    return result;
}

void submission_pipeline::save_result(submission_result &result) {
    try {
        if (result.state == submission_state::CANCELLED)
            store.mark_cancelled(result.submission_id);
        else if (result.state == submission_state::FAILED)
            store.mark_failed(result.submission_id, result.failure_reason);
        else
            store.finalize(result);
        return;
    } catch (system_error &e) {
        LOG(ERROR) << "Submission " << result.submission_id << " result not saved: " << e.what();
        result.state = submission_state::FAILED;
        result.failure_reason = e.what();
        result.tests.clear();
    }

    // 写入失败的记录仍然是评测中状态，不计入提交次数
    try {
        store.mark_failed(result.submission_id, result.failure_reason);
    } catch (system_error &e) {
        LOG(ERROR) << "Submission " << result.submission_id << " failure not saved: " << e.what();
    }
}

vector<test_outcome> submission_pipeline::run_all(const artifact &program, const vector<test_case> &tests, live_entry &entry) const {
    size_t n = tests.size();
    vector<optional<test_outcome>> slots(n);
    atomic<size_t> next{0};
    atomic<bool> aborted{false};
    mutex error_mut;
    exception_ptr first_error;

    auto work = [&] {
        while (!aborted && !entry.cancel.is_cancelled()) {
            size_t i = next++;
            if (i >= n) return;
            try {
                slots[i] = run_test(runner, program, tests[i], i, &entry.cancel);
                ++entry.completed;
            } catch (...) {
                // 其他线程不再领取新的测试点，异常在所有线程结束后重新抛出
                scoped_lock lock(error_mut);
                if (!first_error) first_error = current_exception();
                aborted = true;
            }
        }
    };

    size_t parallelism = min(max<size_t>(runner.limits().parallelism, 1), max<size_t>(n, 1));
    vector<thread> threads;
    {
        defer {
            for (auto &t : threads) t.join();
        };
        for (size_t i = 1; i < parallelism; ++i) threads.emplace_back(work);
        work();
    }

    if (first_error) rethrow_exception(first_error);

    vector<test_outcome> outcomes;
    if (entry.cancel.is_cancelled()) return outcomes;
    for (auto &slot : slots) {
        if (!slot) throw internal_error("test outcome missing after all tests finished");
        outcomes.push_back(move(*slot));
    }
    return outcomes;
}

void submission_pipeline::publish_result(const submission_result &result, admission_kind kind, const server::problem &prob) {
    size_t passed = result.passed_count();
    size_t failed = result.tests.size() - passed;
    double score = to_percentage(result.score());
    auto now = chrono::system_clock::now();

    if (kind == admission_kind::SUBMISSION) {
        events.publish(server::submission_finalized{result.submission_id, result.submitter, result.problem, prob.title,
                                                    result.state, passed, failed, score, result.success(), now});
        // 只有计入提交次数的提交会改变排行榜
        if (result.state == submission_state::COMPLETED || result.state == submission_state::COMPILE_FAILED) {
            auto standing = server::compute_standing(store, result.submitter, config.packet.problems.size());
            events.publish(server::score_update{standing.submitter, standing.score, move(standing.states), now});
        }
    } else
        events.publish(server::test_evaluation{result.submitter, result.problem, prob.title, passed, failed, score, now});
}

}  // namespace arbiter
