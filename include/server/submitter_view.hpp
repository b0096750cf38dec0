#pragma once

#include <nlohmann/json.hpp>
#include "judge/submission.hpp"

namespace arbiter::server {

/**
 * @brief 生成返回给选手的评测结果
 * 编译错误信息会被截断；所有测试点都返回结果类型，但只有可见测试点返回程序的输出，
 * 隐藏测试点的输出只保存在历史记录中。
 * @param result 评测结果
 * @param max_compile_error 编译错误信息保留的最大长度
 */
nlohmann::json submitter_view(const submission_result &result, std::size_t max_compile_error);

}  // namespace arbiter::server
