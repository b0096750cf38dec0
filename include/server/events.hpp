#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <variant>
#include <vector>
#include "common/status.hpp"

namespace arbiter::server {

using event_time = std::chrono::system_clock::time_point;

/**
 * @brief 提交通过准入检查，进入评测流水线
 */
struct submission_queued {
    std::string submission_id;
    std::string submitter;
    std::size_t problem;
    event_time time;
};

/**
 * @brief 提交评测结束（包括编译失败、取消和失败）
 */
struct submission_finalized {
    std::string submission_id;
    std::string submitter;
    std::size_t problem;
    std::string problem_title;
    submission_state state;
    std::size_t passed;
    std::size_t failed;

    /**
     * @brief 通过测试点的百分比
     */
    double score;

    bool success;
    event_time time;
};

/**
 * @brief 一次测试运行（只运行可见测试点）结束
 */
struct test_evaluation {
    std::string submitter;
    std::size_t problem;
    std::string problem_title;
    std::size_t passed;
    std::size_t failed;
    double score;
    event_time time;
};

/**
 * @brief 一支队伍在排行榜上的成绩发生变化，在计入提交次数的提交结束后发布
 */
struct score_update {
    std::string submitter;
    double score;

    /**
     * @brief 下标为题目编号
     */
    std::vector<problem_state> states;
    event_time time;
};

struct announcement {
    std::string announcer;
    std::string message;
    event_time time;
};

struct paused {
    std::string paused_by;
    event_time time;
};

struct unpaused {
    std::string unpaused_by;
    event_time time;
};

struct check_in {
    std::string name;
    event_time time;
};

/**
 * @brief 服务器产生的事件，会被广播给订阅者并传递给外部事件钩子
 */
using server_event = std::variant<submission_queued, submission_finalized, test_evaluation, score_update,
                                  announcement, paused, unpaused, check_in>;

/**
 * @brief 事件类型的名称，与序列化后 JSON 的 kind 字段相同
 */
const char *event_kind(const server_event &event);

/**
 * @brief 将时间格式化为 UTC 的 ISO 8601 字符串
 */
std::string format_time(event_time time);

void to_json(nlohmann::json &j, const server_event &event);

/**
 * @brief 事件的发布端
 * 发布必须是非阻塞的，事件处理的成功与否不影响发布者。
 */
struct event_publisher {
    virtual ~event_publisher();

    virtual void publish(const server_event &event) = 0;
};

}  // namespace arbiter::server
