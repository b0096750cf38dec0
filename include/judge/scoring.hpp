#pragma once

#include <boost/rational.hpp>
#include <optional>
#include <vector>
#include "judge/submission.hpp"

namespace arbiter {

/**
 * @brief 计算分数：通过的测试点的权重之和 / 全部测试点的权重之和
 * 使用有理数避免浮点误差，这样满分可以精确地与 1 比较。
 * 没有测试点时分数为 0。
 */
boost::rational<int> compute_score(const std::vector<test_outcome> &tests);

/**
 * @brief 提交是否完全正确
 * @param compile 编译结果，解释型语言为空
 * @param tests 全部测试点的结果
 */
bool compute_success(const std::optional<compile_outcome> &compile, const std::vector<test_outcome> &tests);

/**
 * @brief 将分数转换为百分比，用于展示
 */
double to_percentage(const boost::rational<int> &score);

}  // namespace arbiter
