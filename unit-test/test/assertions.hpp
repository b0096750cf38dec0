#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

namespace arbiter::test {

/**
 * @brief 比较两个 JSON 对象，失败时输出两边的内容以及 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression, const char *rhs_expression,
                                             const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "  " << lhs_expression << ":" << std::endl
       << lhs.dump(2) << std::endl
       << "  should equal " << rhs_expression << ":" << std::endl
       << rhs.dump(2) << std::endl
       << "  patch:" << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace arbiter::test

#define EXPECT_JSON_EQ(lhs, rhs) EXPECT_PRED_FORMAT2(::arbiter::test::json_equal, lhs, rhs)
