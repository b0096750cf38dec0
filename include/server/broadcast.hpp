#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "server/events.hpp"

namespace arbiter::server {

/**
 * @brief 一个实时订阅者的消息队列
 * 订阅者关闭队列即取消订阅，下一次广播时会被移除。
 */
using subscription = concurrent_queue<nlohmann::json>;

/**
 * @brief 进程内的实时广播
 * 每个订阅者拥有自己的消息队列，广播时把消息放入所有仍然打开的队列。
 */
struct subscriber_hub {
    std::shared_ptr<subscription> subscribe();

    /**
     * @brief 广播一条消息
     * @return 收到消息的订阅者数量
     */
    std::size_t broadcast(const nlohmann::json &message);

    /**
     * @brief 将事件序列化后广播，可以直接注册为 event_dispatcher 的处理函数
     */
    void operator()(const server_event &event);

    std::size_t subscriber_count() const;

private:
    mutable std::mutex mut;
    std::vector<std::shared_ptr<subscription>> subscribers;
};

}  // namespace arbiter::server
