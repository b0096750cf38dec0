#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
#include "common/status.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace arbiter {

/**
 * @brief 准入检查的键空间
 * 一个选手在同一道题目上可以同时有一个正式提交和一个测试运行。
 */
enum class admission_kind {
    SUBMISSION = 0,
    TEST_RUN = 1
};

/**
 * @brief 正在评测的提交的进度快照
 */
struct live_progress {
    std::string id;
    std::string submitter;
    std::size_t problem;
    admission_kind kind;
    submission_state state;
    std::size_t completed;
    std::size_t total;
};

/**
 * @brief 一个正在评测的提交
 * 评测流水线更新状态和进度，其他线程通过 registry 读取进度或者发出取消信号。
 */
struct live_entry {
    live_entry(const submission &submit, admission_kind kind, std::size_t total);

    const std::string id;
    const std::string submitter;
    const std::size_t problem;
    const admission_kind kind;
    const std::size_t total;

    std::atomic<submission_state> state;

    /**
     * @brief 已经完成的测试点数量，只增不减
     */
    std::atomic<std::size_t> completed;

    sandbox::cancellation_token cancel;

    live_progress snapshot() const;
};

/**
 * @brief 正在评测的提交表
 *
 * 按提交 id 以及 (选手, 题目, 类型) 两种方式索引。所有操作都在一把锁内原子地完成，
 * 调用方不会在持有锁的情况下执行沙箱命令。
 * 表项由 registration 持有，registration 析构时恰好移除一次，
 * 这样即使评测因为异常提前退出也不会留下阻止重新提交的表项。
 */
struct submission_registry {
    /**
     * @brief 一个表项的所有权，只能移动
     */
    struct registration {
        registration();
        registration(submission_registry *registry, std::shared_ptr<live_entry> entry);
        registration(registration &&other) noexcept;
        registration &operator=(registration &&other) noexcept;
        ~registration();

        registration(const registration &) = delete;
        registration &operator=(const registration &) = delete;

        explicit operator bool() const;

        live_entry &entry() const;

        /**
         * @brief 立即移除表项，之后的调用没有效果
         */
        void release();

    private:
        submission_registry *registry;
        std::shared_ptr<live_entry> item;
    };

    /**
     * @brief 准入检查并插入表项
     * @param submit 要评测的提交
     * @param kind 正式提交还是测试运行
     * @param total 测试点数量
     * @param reason 被拒绝时写入拒绝原因
     * @return 插入成功时返回持有表项的 registration，否则返回空的 registration
     */
    registration admit(const submission &submit, admission_kind kind, std::size_t total, rejection_reason &reason);

    std::optional<live_progress> lookup(const std::string &id) const;

    /**
     * @brief 列出所有正在评测的提交
     */
    std::vector<live_progress> list() const;

    /**
     * @brief 向一个正在评测的提交发出取消信号
     * @return 提交是否存在
     */
    bool cancel(const std::string &id);

    /**
     * @brief 向所有正在评测的提交发出取消信号
     */
    void cancel_all();

    std::size_t size() const;

private:
    using admission_key = std::tuple<std::string, std::size_t, admission_kind>;

    mutable std::mutex mut;
    std::unordered_map<std::string, std::shared_ptr<live_entry>> by_id;
    std::map<admission_key, std::string> by_key;

    void remove(const live_entry &entry);
};

}  // namespace arbiter
