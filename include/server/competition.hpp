#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "judge/language.hpp"
#include "judge/runner.hpp"
#include "judge/submission.hpp"

namespace arbiter {

void from_json(const nlohmann::json &j, test_case &test);
void from_json(const nlohmann::json &j, test_runner_config &config);
void from_json(const nlohmann::json &j, sandbox_config &config);

}  // namespace arbiter

namespace arbiter::server {

struct problem {
    std::string title;

    std::string description;

    /**
     * @brief 允许使用的语言，为空表示所有配置的语言都可以使用
     */
    std::optional<std::vector<std::string>> languages;

    std::vector<test_case> tests;

    bool allows(const std::string &language) const;

    /**
     * @brief 只包含可见测试点的列表，用于测试运行
     */
    std::vector<test_case> visible_tests() const;
};

struct packet {
    std::string title;
    std::string preamble;
    std::vector<problem> problems;
};

/**
 * @brief 比赛配置
 */
struct competition_config {
    /**
     * @brief 每个选手每道题目的最大提交次数，为空表示不限制
     */
    std::optional<int> max_submissions;

    /**
     * @brief 比赛时长，为空表示不限时
     */
    std::optional<std::chrono::milliseconds> duration;

    test_runner_config test_runner;

    sandbox_config sandbox;

    /**
     * @brief 语言名称到语言配置
     */
    std::map<std::string, language> languages;

    /**
     * @brief 接收事件的外部程序
     */
    std::vector<std::filesystem::path> event_hooks;

    /**
     * @brief 外部程序处理一个事件的墙钟时间限制
     */
    std::chrono::milliseconds hook_timeout{10000};

    struct packet packet;

    /**
     * @return 语言配置，不存在时返回 nullptr
     */
    const language *find_language(const std::string &name) const;

    /**
     * @return 题目，下标越界时返回 nullptr
     */
    const problem *find_problem(std::size_t index) const;
};

void from_json(const nlohmann::json &j, problem &prob);
void from_json(const nlohmann::json &j, packet &pkt);

/**
 * @brief 解析并检查比赛配置
 * @throw configuration_error 配置不合法时
 */
competition_config parse_competition(const nlohmann::json &j);

/**
 * @brief 从 JSON 文件加载比赛配置
 * @throw configuration_error 文件不存在、不是合法的 JSON 或者配置不合法时
 */
competition_config load_competition(const std::filesystem::path &path);

/**
 * @brief 检查配置的一致性
 * 每道题目至少有一个测试点，权重为正，允许的语言都已配置，资源限制为正。
 * @throw configuration_error 检查不通过时
 */
void validate(const competition_config &config);

}  // namespace arbiter::server
