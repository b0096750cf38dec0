#pragma once

#include <string>
#include "judge/runner.hpp"
#include "judge/submission.hpp"
#include "sandbox/limits.hpp"

namespace arbiter {

/**
 * @brief 比较前对输出的规范化
 * @param text 选手输出或者标准输出
 * @param trim 是否去除首尾的空白字符
 */
std::string normalize_output(const std::string &text, bool trim);

/**
 * @brief 根据一次运行的结果判定测试点结果
 * 判定顺序：超时 > 超出内存或输出限制 > 非零返回值或被信号杀死 > 比较输出。
 * 结果只取决于 report 和 expected，对同一个 report 判定多次结果相同。
 * @param report 资源限制器返回的运行结果
 * @param expected 标准输出
 * @param trim 比较前是否去除两边输出的首尾空白字符
 */
test_result_kind classify(const sandbox::execution_report &report, const std::string &expected, bool trim);

/**
 * @brief 运行一个测试点并判定结果
 * @param runner 语言运行器
 * @param program 已经编译好的选手程序
 * @param test 测试点
 * @param index 测试点下标
 * @param cancel 取消信号
 * @throw sandbox_error 选手程序无法启动时
 */
test_outcome run_test(const language_runner &runner, const artifact &program, const test_case &test, std::size_t index,
                      const sandbox::cancellation_token *cancel = nullptr);

}  // namespace arbiter
