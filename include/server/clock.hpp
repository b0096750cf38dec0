#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "server/events.hpp"

namespace arbiter::server {

/**
 * @brief 比赛时钟的快照
 */
struct clock_state {
    bool paused;

    /**
     * @brief 比赛进行的时间，不包括暂停的时间
     */
    std::chrono::milliseconds elapsed;

    /**
     * @brief 累计暂停的时间
     */
    std::chrono::milliseconds total_paused;

    /**
     * @brief 剩余时间，比赛没有时长限制时为空
     */
    std::optional<std::chrono::milliseconds> remaining;
};

/**
 * @brief 比赛时钟
 * 比赛从时钟创建时开始。暂停和恢复只在状态真正改变时发布一次事件，
 * 重复暂停或者在未暂停时恢复都不会产生事件。
 */
struct competition_clock {
    /**
     * @param publisher 事件发布端，可以为空
     * @param time_limit 比赛时长，为空表示不限时
     */
    competition_clock(event_publisher *publisher, std::optional<std::chrono::milliseconds> time_limit = std::nullopt);

    /**
     * @return 时钟是否从运行变为暂停
     */
    bool pause(const std::string &by);

    /**
     * @return 时钟是否从暂停变为运行
     */
    bool unpause(const std::string &by);

    bool is_paused() const;

    clock_state state() const;

private:
    using clock = std::chrono::steady_clock;

    mutable std::mutex mut;
    event_publisher *publisher;
    std::optional<std::chrono::milliseconds> time_limit;
    clock::time_point start_time;
    std::optional<clock::time_point> pause_time;
    clock::duration total_paused;
};

}  // namespace arbiter::server
