#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include "judge/pipeline.hpp"
#include "judge/registry.hpp"
#include "judge/runner.hpp"
#include "sandbox/sandbox.hpp"
#include "server/broadcast.hpp"
#include "server/clock.hpp"
#include "server/competition.hpp"
#include "server/event_dispatcher.hpp"
#include "server/submission_store.hpp"

namespace arbiter::server {

/**
 * @brief 比赛服务
 * 持有一场比赛运行所需的所有组件，并将 JSON 请求分发到对应的组件。
 *
 * 请求格式为 {"kind": ..., ...}，kind 可以是：
 * submit、test、announce、pause、unpause、check_in、cancel、status、leaderboard。
 * 格式错误的请求返回 {"error": ...}，不会影响服务的运行。
 *
 * handle 可以被多个 worker 线程同时调用。
 */
struct competition_server {
    /**
     * @param config 比赛配置
     * @param executor 执行选手程序的沙箱
     * @param store 提交记录
     * @param scratch_root 临时目录的根目录
     * @param keep_scratch 是否保留临时目录
     */
    competition_server(competition_config config, std::unique_ptr<sandbox::sandbox> executor,
                       std::unique_ptr<submission_store> store, std::filesystem::path scratch_root,
                       bool keep_scratch = false);

    ~competition_server();

    /**
     * @brief 启动事件分发线程
     */
    void start();

    /**
     * @brief 停止接受新的提交，并取消所有正在评测的提交
     * 之后调用方需要等待所有调用 handle 的线程结束，再调用 stop。
     */
    void shutdown();

    /**
     * @brief 处理一个请求
     * @return 返回给请求方的 JSON
     * @throw internal_error 评测系统内部错误
     */
    nlohmann::json handle(const nlohmann::json &request);

    /**
     * @brief 处理完剩余的事件后停止事件分发，必须在所有 worker 结束后调用
     */
    void stop();

    const competition_config &config() const;

    submission_pipeline &pipeline();

    subscriber_hub &hub();

    competition_clock &clock();

    submission_store &store();

private:
    competition_config conf;
    std::unique_ptr<sandbox::sandbox> executor;
    std::unique_ptr<submission_store> records;
    event_dispatcher dispatcher;
    subscriber_hub subscribers;
    competition_clock timer;
    submission_registry registry;
    language_runner runner;
    submission_pipeline judge;

    nlohmann::json handle_submission(const nlohmann::json &request, bool test_run);

    nlohmann::json status() const;
};

}  // namespace arbiter::server
