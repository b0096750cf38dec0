#pragma once

#include <boost/rational.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace arbiter {

/**
 * @brief 题目的一个测试点，由比赛配置定义，运行期间不会改变
 */
struct test_case {
    /**
     * @brief 写入选手程序标准输入的数据
     */
    std::string input;

    /**
     * @brief 标准输出
     */
    std::string output;

    /**
     * @brief 是否对选手可见
     * 隐藏的测试点同样计分，但是不会将选手程序的输出返回给选手
     */
    bool visible = false;

    /**
     * @brief 测试点的分值权重，必须为正数
     */
    int weight = 1;
};

/**
 * @brief 一个选手对一道题目的一次提交，创建后不会被修改，重新提交会产生新的 submission
 */
struct submission {
    /**
     * @brief 提交 id，string 可以兼容一切情况
     */
    std::string id;

    /**
     * @brief 选手（队伍）名称
     */
    std::string submitter;

    /**
     * @brief 题目在比赛题目列表中的下标
     */
    std::size_t problem = 0;

    /**
     * @brief 语言名称，对应配置中 languages 的键
     */
    std::string language;

    std::string source;

    std::chrono::system_clock::time_point created_at;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.id << ":" << submit.submitter << "-" << submit.problem << "]";
    return os;
}

/**
 * @brief 编译的结果，每个提交最多产生一次，先于所有测试点
 */
struct compile_outcome {
    bool success = false;

    std::string out;
    std::string err;

    int exit_code = -1;

    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 编译器超出了资源限制
     */
    limit_violation violation = limit_violation::NONE;
};

/**
 * @brief 一个测试点的运行结果
 * 每个提交的每个测试点最多一个，由 (提交 id, 测试点下标) 唯一确定
 */
struct test_outcome {
    std::size_t index = 0;

    test_result_kind kind = test_result_kind::FAIL;

    std::string out;
    std::string err;

    int exit_code = -1;

    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 对应测试点是否对选手可见
     */
    bool visible = false;

    /**
     * @brief 对应测试点的权重
     */
    int weight = 1;
};

/**
 * @brief 一个提交的最终结果
 * 分数和是否通过由编译结果和测试点结果推导，不能被直接设置。
 */
struct submission_result {
    std::string submission_id;
    std::string submitter;
    std::size_t problem = 0;

    submission_state state = submission_state::QUEUED;

    /**
     * @brief 当 state 为 REJECTED 时表示拒绝原因
     */
    rejection_reason rejection = rejection_reason::NONE;

    /**
     * @brief 编译结果，解释型语言没有编译步骤时为空
     */
    std::optional<compile_outcome> compile;

    /**
     * @brief 按测试点下标排序的测试点结果，只有 COMPLETED 状态才非空
     */
    std::vector<test_outcome> tests;

    std::chrono::milliseconds elapsed{0};

    /**
     * @brief 该题目剩余的提交次数，没有次数限制时为空
     */
    std::optional<int> remaining_attempts;

    /**
     * @brief state 为 FAILED 时，沙箱基础设施错误的描述
     */
    std::string failure_reason;

    /**
     * @brief 通过的测试点权重之和除以总权重
     */
    boost::rational<int> score() const;

    /**
     * @brief 编译成功（或者不需要编译）且所有测试点都通过
     */
    bool success() const;

    std::size_t passed_count() const;
};

}  // namespace arbiter
