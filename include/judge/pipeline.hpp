#pragma once

#include <atomic>
#include <vector>
#include "judge/registry.hpp"
#include "judge/runner.hpp"
#include "judge/submission.hpp"
#include "server/competition.hpp"
#include "server/events.hpp"
#include "server/submission_store.hpp"

namespace arbiter {

/**
 * @brief 提交评测流水线
 *
 * 一个提交的生命周期：
 * 1. 检查题目和语言，通过 registry 进行准入检查（同一选手同一题目同时只能有一个提交），
 *    检查提交次数限制；
 * 2. 创建临时目录，编译选手程序，编译结束后写入评测中的历史记录；
 * 3. 以不超过 parallelism 的并发度运行所有测试点，每个测试点互相独立；
 * 4. 按测试点下标排序汇总结果，写入最终的历史记录，移除 registry 表项，发布事件。
 *
 * submit 和 run_tests 在调用线程上同步执行，可以被多个线程同时调用。
 * 被取消的提交不保存任何测试点结果。
 */
struct submission_pipeline {
    /**
     * 所有参数的生命周期必须长于 pipeline
     */
    submission_pipeline(const server::competition_config &config, const language_runner &runner,
                        submission_registry &registry, server::submission_store &store,
                        server::event_publisher &events);

    /**
     * @brief 评测一个正式提交
     * 准入检查失败时返回 REJECTED 状态的结果，不修改任何状态。
     * @throw internal_error 评测系统内部错误
     */
    submission_result submit(const submission &submit);

    /**
     * @brief 只运行题目的可见测试点，不保存提交记录，不计入提交次数
     */
    submission_result run_tests(const submission &submit);

    /**
     * @brief 停止接受新的提交，并取消所有正在评测的提交
     */
    void shutdown();

    bool is_shutting_down() const;

    submission_registry &live() const;

private:
    const server::competition_config &config;
    const language_runner &runner;
    submission_registry &registry;
    server::submission_store &store;
    server::event_publisher &events;
    std::atomic<bool> stopping{false};

    submission_result evaluate(const submission &submit, admission_kind kind);

    std::vector<test_outcome> run_all(const artifact &program, const std::vector<test_case> &tests, live_entry &entry) const;

    std::optional<int> remaining_attempts(const submission &submit) const;

    /**
     * @brief 写入最终的历史记录，写入失败时将结果改为 FAILED
     */
    void save_result(submission_result &result);

    void publish_result(const submission_result &result, admission_kind kind, const server::problem &prob);
};

}  // namespace arbiter
