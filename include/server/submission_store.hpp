#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace arbiter {

void to_json(nlohmann::json &j, const compile_outcome &outcome);
void from_json(const nlohmann::json &j, compile_outcome &outcome);

void to_json(nlohmann::json &j, const test_outcome &outcome);
void from_json(const nlohmann::json &j, test_outcome &outcome);

}  // namespace arbiter

namespace arbiter::server {

/**
 * @brief 一个提交的历史记录
 * 包含编译的返回值和输出，以及每个测试点的结果、输出和运行时间。
 */
struct submission_record {
    std::string id;
    std::string submitter;
    std::size_t problem = 0;
    std::string language;
    std::string source;
    std::chrono::system_clock::time_point created_at;

    submission_state state = submission_state::RUNNING;

    std::optional<compile_outcome> compile;

    std::vector<test_outcome> tests;

    /**
     * @brief 通过测试点的百分比
     */
    double score = 0;

    bool success = false;

    std::chrono::milliseconds elapsed{0};

    std::string failure_reason;
};

void to_json(nlohmann::json &j, const submission_record &record);
void from_json(const nlohmann::json &j, submission_record &record);

/**
 * @brief 提交记录的持久化接口
 *
 * 写入分为两个阶段：编译结束后 create_pending 写入提交和编译结果，
 * 评测结束后 finalize 一次性写入汇总结果和所有测试点结果。
 * 已经结束的记录不会再被修改。
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 编译结束后创建一条评测中的记录
     * @throw internal_error 记录已经存在时
     */
    virtual void create_pending(const submission &submit, const std::optional<compile_outcome> &compile) = 0;

    /**
     * @brief 写入最终结果
     * @throw internal_error 记录不存在或者已经结束时
     */
    virtual void finalize(const submission_result &result) = 0;

    /**
     * @brief 评测因为沙箱基础设施错误而失败
     */
    virtual void mark_failed(const std::string &id, const std::string &reason) = 0;

    /**
     * @brief 评测被取消，已经完成的测试点结果不会被保存
     */
    virtual void mark_cancelled(const std::string &id) = 0;

    /**
     * @brief 选手在一道题目上已经使用的提交次数
     * 只计入编译失败或者评测完成的提交，被取消、失败或者没有结果的提交不计入
     */
    virtual int count_attempts(const std::string &submitter, std::size_t problem) const = 0;

    /**
     * @brief 记录一次测试运行，测试运行不保存代码和结果，也不计入提交次数
     */
    virtual void record_test_run(const std::string &submitter, std::size_t problem) = 0;

    virtual int count_test_runs(const std::string &submitter, std::size_t problem) const = 0;

    virtual std::optional<submission_record> find(const std::string &id) const = 0;

    /**
     * @brief 选手在每道题目上最近一次计入提交次数的提交，按题目排序
     */
    virtual std::vector<submission_record> latest_results(const std::string &submitter) const = 0;

    /**
     * @brief 有过提交或者测试运行的选手，按名称排序
     */
    virtual std::vector<std::string> submitters() const = 0;
};

/**
 * @brief 只保存在内存中的提交记录，服务重启后丢失
 */
struct memory_submission_store : public submission_store {
    void create_pending(const submission &submit, const std::optional<compile_outcome> &compile) override;
    void finalize(const submission_result &result) override;
    void mark_failed(const std::string &id, const std::string &reason) override;
    void mark_cancelled(const std::string &id) override;
    int count_attempts(const std::string &submitter, std::size_t problem) const override;
    void record_test_run(const std::string &submitter, std::size_t problem) override;
    int count_test_runs(const std::string &submitter, std::size_t problem) const override;
    std::optional<submission_record> find(const std::string &id) const override;
    std::vector<submission_record> latest_results(const std::string &submitter) const override;
    std::vector<std::string> submitters() const override;

protected:
    mutable std::mutex mut;

    /**
     * @brief 每次修改记录之前在持有锁的情况下调用，抛出异常时修改被放弃
     * @param op 修改类型：pending、update 或 test_run
     * @param payload 修改后的记录，或者测试运行的选手和题目
     */
    virtual void persist(const std::string &op, const nlohmann::json &payload);

    /**
     * @brief 重放一次修改，要求调用方持有 mut
     * @throw internal_error 修改类型未知时
     */
    void apply(const std::string &op, const nlohmann::json &payload);

private:
    std::map<std::string, submission_record> records;
    std::map<std::pair<std::string, std::size_t>, int> test_runs;

    // 记录第一次写入的顺序，用于找出最近的提交
    std::vector<std::string> order;

    const submission_record &find_running(const std::string &id) const;

    /**
     * @brief 写入历史后替换内存中的记录，写入失败时抛出异常且不修改任何记录
     */
    void commit(const std::string &op, submission_record record);

    void replace(submission_record record);
};

/**
 * @brief 追加写入 JSON Lines 文件的提交记录
 * 每次修改追加一行 {"op": ..., "payload": ...}，构造时重放已有的文件恢复内存中的记录。
 */
struct jsonl_submission_store : public memory_submission_store {
    /**
     * @throw std::system_error 无法打开文件时
     * @throw internal_error 已有的文件格式不正确时
     */
    explicit jsonl_submission_store(const std::filesystem::path &path);

protected:
    void persist(const std::string &op, const nlohmann::json &payload) override;

private:
    std::filesystem::path path;
    std::ofstream fout;
};

}  // namespace arbiter::server
