#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "server/competition_server.hpp"

/**
 * 评测 worker 相关函数
 * 主线程读入请求后放入 request_queue，每个 worker 线程不断从队列中取出请求交给
 * competition_server 处理，并将结果交给 response_handler。
 *
 * 一个提交完全在取到它的 worker 上评测（编译、运行测试点、写入记录），
 * 因此同时评测的提交数量不超过 worker 的数量。
 * 关闭队列后，worker 处理完队列中剩余的请求后自然退出。
 */
namespace arbiter {

using request_queue = concurrent_queue<nlohmann::json>;

/**
 * @brief 处理请求结果的回调，可能被多个 worker 同时调用
 */
using response_handler = std::function<void(const nlohmann::json &)>;

/**
 * @brief 启动 worker 线程
 * @param worker_id worker 编号，只用于日志
 * @param server 处理请求的比赛服务
 * @param requests 请求队列
 * @param respond 处理请求结果的回调
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, server::competition_server &server, request_queue &requests,
                         response_handler respond);

}  // namespace arbiter
