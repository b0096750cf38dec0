#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "server/submission_store.hpp"

namespace arbiter::server {

/**
 * @brief 一支队伍在排行榜上的成绩
 */
struct team_standing {
    std::string submitter;

    /**
     * @brief 每道题目最近一次提交的分数之和
     */
    double score = 0;

    /**
     * @brief 下标为题目编号
     */
    std::vector<problem_state> states;
};

/**
 * @brief 根据历史记录计算一支队伍的成绩
 * 每道题目的状态由最近一次编译失败或者评测完成的提交决定，完全正确为 PASS，否则为 FAIL；
 * 没有这样的提交时，做过测试运行为 IN_PROGRESS，否则为 NOT_ATTEMPTED。
 * @param problem_count 题目数量
 */
team_standing compute_standing(const submission_store &store, const std::string &submitter, std::size_t problem_count);

/**
 * @brief 所有有过提交或者测试运行的队伍，按分数从高到低排序，分数相同时按名称排序
 */
std::vector<team_standing> compute_leaderboard(const submission_store &store, std::size_t problem_count);

void to_json(nlohmann::json &j, const team_standing &standing);

}  // namespace arbiter::server
