#pragma once

#include <nlohmann/json.hpp>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "gmock/gmock.h"
#include "judge/language.hpp"
#include "judge/runner.hpp"
#include "judge/submission.hpp"
#include "server/events.hpp"
#include "server/submission_store.hpp"

/**
 * 测试用的公共工具
 * 测试直接通过真实的沙箱运行 /bin/sh 和 python3，不需要编译器。
 */
namespace arbiter::test {

/**
 * @brief 测试使用的临时目录根目录，测试结束后删除
 */
inline std::filesystem::path scratch_root() {
    return std::filesystem::path("/tmp") / ("arbiter-test-" + std::to_string(getpid()));
}

/**
 * @brief 系统自带的 python3，不存在时返回空字符串
 */
inline std::string system_python() {
    for (const char *candidate : {"/usr/bin/python3", "/usr/local/bin/python3"})
        if (access(candidate, X_OK) == 0) return candidate;
    return "";
}

/**
 * @brief 直接用 sh 解释执行的语言
 */
inline language shell_language() {
    return parse_language("sh", {{"run", "sh {source_file}"}, {"source_file", "solution.sh"}});
}

/**
 * @brief 需要"编译"的语言：编译步骤用 sh -n 检查语法，语法错误时编译失败
 */
inline language checked_shell_language() {
    return parse_language("checked-sh", {{"build", "sh -n {source_file}"}, {"run", "sh {source_file}"}, {"source_file", "main.sh"}});
}

inline language python_language() {
    return parse_language("python3", {{"run", system_python() + " {source_file}"}, {"source_file", "solution.py"}});
}

/**
 * @brief 较短的时间限制，较宽松的内存限制（python 解释器启动就需要不少内存）
 */
inline test_runner_config fast_limits() {
    test_runner_config config;
    config.timeout = std::chrono::milliseconds(5000);
    config.compile_memory = 256ll << 20;
    config.run_memory = 256ll << 20;
    config.parallelism = 4;
    return config;
}

/**
 * @brief 不限制网络和文件系统，测试环境中的内核可能不支持这些隔离
 */
inline sandbox_config open_sandbox() {
    sandbox_config config;
    config.restrict_network = false;
    config.restrict_filesystem = false;
    return config;
}

inline submission make_submission(const std::string &id, const std::string &submitter, std::size_t problem,
                                  const std::string &language, const std::string &source) {
    submission submit;
    submit.id = id;
    submit.submitter = submitter;
    submit.problem = problem;
    submit.language = language;
    submit.source = source;
    submit.created_at = std::chrono::system_clock::now();
    return submit;
}

inline test_case make_test(const std::string &input, const std::string &output, bool visible = false, int weight = 1) {
    test_case test;
    test.input = input;
    test.output = output;
    test.visible = visible;
    test.weight = weight;
    return test;
}

/**
 * @brief 等待条件成立，超时返回 false
 */
inline bool wait_until(const std::function<bool()> &condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

/**
 * @brief 同步记录所有事件的发布端
 * on_publish 在记录事件之前被调用，可以用来检查发布事件时其他组件的状态。
 */
struct recording_publisher : public server::event_publisher {
    std::function<void(const server::server_event &)> on_publish;

    void publish(const server::server_event &event) override {
        if (on_publish) on_publish(event);
        std::scoped_lock lock(mut);
        recorded.push_back(event);
    }

    std::vector<server::server_event> events() const {
        std::scoped_lock lock(mut);
        return recorded;
    }

    std::vector<std::string> kinds() const {
        std::vector<std::string> result;
        for (auto &event : events()) result.push_back(server::event_kind(event));
        return result;
    }

private:
    mutable std::mutex mut;
    std::vector<server::server_event> recorded;
};

struct mock_event_publisher : public server::event_publisher {
    MOCK_METHOD(void, publish, (const server::server_event &event), (override));
};

/**
 * @brief 前 writes_before_failure 次写入成功，之后每次写入都失败的存储
 */
struct failing_store : public server::memory_submission_store {
    std::atomic<int> writes_before_failure;

    explicit failing_store(int writes_before_failure) : writes_before_failure(writes_before_failure) {}

protected:
    void persist(const std::string &op, const nlohmann::json &) override {
        if (writes_before_failure-- <= 0)
            throw std::system_error(ENOSPC, std::system_category(), "unable to write " + op);
    }
};

}  // namespace arbiter::test
