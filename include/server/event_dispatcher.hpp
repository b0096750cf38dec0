#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "sandbox/sandbox.hpp"
#include "server/events.hpp"

namespace arbiter::server {

/**
 * @brief 事件分发器
 * 发布者将事件放入队列后立即返回。每个处理函数有自己的队列和线程，按发布顺序依次处理事件，
 * 一个处理函数阻塞不会推迟其他处理函数收到事件。
 * 处理函数抛出的异常会被记录到日志，不会影响发布者和其他处理函数。
 */
struct event_dispatcher : public event_publisher {
    using handler = std::function<void(const server_event &)>;

    ~event_dispatcher() override;

    /**
     * @brief 注册处理函数，必须在 start 之前调用
     * @param name 处理函数的名称，用于日志
     */
    void add_handler(handler h, std::string name = "handler");

    /**
     * @brief 为每个处理函数启动分发线程
     */
    void start();

    /**
     * @brief 停止接受新事件，每个处理函数处理完自己队列中剩余的事件后结束
     */
    void stop();

    void publish(const server_event &event) override;

private:
    struct channel {
        std::string name;
        handler h;
        concurrent_queue<server_event> queue;
        std::thread worker;
    };

    std::vector<std::unique_ptr<channel>> channels;
    bool started = false;
    bool stopped = false;
    std::mutex mut;

    static void run(channel &ch);
};

/**
 * @brief 执行外部程序的事件钩子
 * 事件序列化为 JSON 后放在环境变量 ARBITER_EVENT 中，事件类型作为第一个参数。
 * 外部程序通过沙箱在当前目录下执行，超过时间限制会被杀死。
 */
struct command_hook {
    /**
     * @param executor 执行外部程序的沙箱，生命周期必须长于钩子
     * @param executable 外部程序，相对路径相对于当前目录
     * @param timeout 每次执行的墙钟时间限制
     */
    command_hook(sandbox::sandbox &executor, std::filesystem::path executable, std::chrono::milliseconds timeout);

    /**
     * @throw std::runtime_error 外部程序无法启动、超时或者返回非零值时
     */
    void operator()(const server_event &event) const;

private:
    sandbox::sandbox &executor;
    std::filesystem::path executable;
    std::chrono::milliseconds timeout;
};

}  // namespace arbiter::server
