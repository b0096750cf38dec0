#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace arbiter::sandbox {

/**
 * @brief 一次受限执行的资源限制
 * 所有为 0 或负数的上限表示不做限制。
 */
struct resource_limits {
    /**
     * @brief 墙钟时间限制，超过后整个进程组会被 SIGKILL
     */
    std::chrono::milliseconds wall_timeout{0};

    /**
     * @brief CPU 时间限制，通过 RLIMIT_CPU 实现，精度为秒
     */
    std::chrono::milliseconds cpu_timeout{0};

    /**
     * @brief 内存上限（字节）
     * 内核支持时通过 cgroup 的 memory.max 实现，否则父进程周期性地采样子进程的常驻内存，
     * 超出时杀死整个进程组。
     */
    int64_t memory_limit = 0;

    /**
     * @brief stdout 和 stderr 各自最多捕获的字节数
     */
    std::size_t output_limit = 0;

    /**
     * @brief 为真时输出超过 output_limit 会杀死子进程并报告 OUTPUT 违规，
     * 否则只截断捕获的内容（编译器的输出一般是这样处理的）
     */
    bool enforce_output_limit = true;

    /**
     * @brief 子进程写入单个文件的最大字节数，通过 RLIMIT_FSIZE 实现
     */
    int64_t file_size_limit = 0;

    /**
     * @brief 子进程所属用户的最大进程数，通过 RLIMIT_NPROC 实现
     */
    int proc_limit = -1;

    /**
     * @brief 将子进程移入新的网络命名空间，使其无法访问主机网络
     */
    bool restrict_network = false;

    /**
     * @brief 使用 landlock 限制子进程只能读取 read_only_paths，只能写入工作目录
     */
    bool restrict_filesystem = false;

    std::vector<std::filesystem::path> read_only_paths;
};

/**
 * @brief 一次受限执行的请求
 */
struct execution_request {
    /**
     * @brief 可执行文件 (command[0]) 及其参数
     * command[0] 不包含 "/" 时在 PATH 中查找，包含 "/" 的相对路径相对于 work_dir
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录，也是 restrict_filesystem 时唯一可写的目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string stdin_data;

    resource_limits limits;

    /**
     * @brief 额外的环境变量，子进程的环境变量只有 PATH、HOME 和这些
     */
    std::map<std::string, std::string> env;
};

/**
 * @brief 捕获的一个输出流
 */
struct captured_stream {
    /**
     * @brief 捕获到的内容，不超过 resource_limits::output_limit 字节
     */
    std::string data;

    /**
     * @brief 子进程产生的输出多于捕获的内容
     */
    bool truncated = false;

    /**
     * @brief 子进程实际产生的字节数
     */
    std::size_t total_bytes = 0;
};

/**
 * @brief 一次受限执行的结果
 * 启动失败 (spawned = false)、资源超限 (violation != NONE) 和子进程自身
 * 的非零返回值 (exit_code != 0) 是三种互相独立的情况。
 */
struct execution_report {
    /**
     * @brief 子进程是否成功启动（execve 成功）
     */
    bool spawned = false;

    /**
     * @brief 启动失败的原因
     */
    std::string spawn_error;

    /**
     * @brief 子进程的返回值，被信号杀死时为 128 + 信号
     */
    int exit_code = -1;

    /**
     * @brief 杀死子进程的信号，正常退出时为 0
     */
    int signal = 0;

    captured_stream out;
    captured_stream err;

    std::chrono::milliseconds wall_time{0};
    std::chrono::milliseconds cpu_time{0};

    /**
     * @brief 子进程的峰值内存（字节），使用 cgroup 时为整个子组的峰值
     */
    int64_t memory_bytes = 0;

    /**
     * @brief 违反了哪个资源限制，多个同时成立时按 WALL_TIME、CPU_TIME、MEMORY、OUTPUT 的顺序取第一个
     */
    limit_violation violation = limit_violation::NONE;

    /**
     * @brief 子进程是否因为执行被取消而被杀死
     */
    bool cancelled = false;

    /**
     * @brief 子进程启动成功，没有违反限制，没有被取消，且返回值为 0
     */
    bool succeeded() const;
};

}  // namespace arbiter::sandbox
