#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace arbiter {

/**
 * @brief 评测时的资源限制，对应比赛配置中的 test_runner
 */
struct test_runner_config {
    /**
     * @brief 每次编译或运行的墙钟时间限制，同时用作 CPU 时间限制
     */
    std::chrono::milliseconds timeout{60000};

    /**
     * @brief 比较输出前是否去除首尾空白字符
     */
    bool trim_output = true;

    /**
     * @brief 编译器的内存上限（字节）
     */
    int64_t compile_memory = 128ll << 20;

    /**
     * @brief 选手程序的内存上限（字节）
     */
    int64_t run_memory = 64ll << 20;

    /**
     * @brief 写入单个文件的大小上限（字节）
     */
    int64_t max_file_size = 8192ll << 10;

    /**
     * @brief stdout 和 stderr 各自最多捕获的字节数，选手程序超出时判为 RESOURCE_EXCEEDED
     */
    std::size_t max_output_bytes = 1 << 20;

    /**
     * @brief 一个提交最多同时运行多少个测试点
     */
    std::size_t parallelism = 4;

    /**
     * @brief RLIMIT_NPROC，小于等于 0 表示不限制
     */
    int max_processes = -1;
};

/**
 * @brief 隔离设置，对应比赛配置中的 sandbox
 */
struct sandbox_config {
    /**
     * @brief 要求的隔离手段不可用时拒绝运行，而不是跳过
     */
    bool strict = false;

    bool restrict_network = true;

    bool restrict_filesystem = true;

    /**
     * @brief 每次执行的 memory cgroup 创建在这个 cgroup 之下（相对于 cgroup 挂载点）
     */
    std::string cgroup = "arbiter";

    std::vector<std::filesystem::path> read_only_paths = {"/usr", "/etc", "/dev", "/bin", "/lib", "/lib64"};
};

/**
 * @brief 一个提交的可执行程序：选手代码所在的临时目录以及编译产物
 * 析构时删除整个临时目录。
 */
struct artifact {
    artifact(const language &lang, scratch_directory dir);

    const language &lang;

    scratch_directory dir;

    /**
     * @brief 是否已经编译成功（解释型语言总是为真）
     */
    bool built;
};

/**
 * @brief 按照语言配置编译和运行选手程序
 * 所有的子进程都通过沙箱执行，runner 本身不保存任何提交相关的状态，可以被多个线程共享。
 */
struct language_runner {
    /**
     * @param executor 执行命令的沙箱，生命周期必须长于 runner
     * @param limits 资源限制
     * @param isolation 隔离设置
     * @param scratch_root 临时目录的根目录
     * @param keep_scratch 为真时不删除临时目录（调试模式）
     */
    language_runner(sandbox::sandbox &executor, test_runner_config limits, sandbox_config isolation,
                    std::filesystem::path scratch_root, bool keep_scratch = false);

    /**
     * @brief 创建临时目录并写入选手源代码
     * @throw sandbox_error 无法创建临时目录或写入源代码时
     */
    std::unique_ptr<artifact> materialize(const language &lang, const std::string &source) const;

    /**
     * @brief 编译选手程序
     * 编译失败（非零返回值或超出资源限制）是正常的结果，通过 compile_outcome 返回。
     * @throw sandbox_error 编译器无法启动时
     */
    compile_outcome build(artifact &program, const sandbox::cancellation_token *cancel = nullptr) const;

    /**
     * @brief 以 stdin_data 为标准输入运行一次选手程序
     * @throw sandbox_error 程序尚未编译时
     */
    sandbox::execution_report execute(const artifact &program, const std::string &stdin_data,
                                      const sandbox::cancellation_token *cancel = nullptr) const;

    const test_runner_config &limits() const;

private:
    sandbox::sandbox &sb;
    test_runner_config config;
    sandbox_config isolation;
    std::filesystem::path scratch_root;
    bool keep_scratch;

    sandbox::resource_limits make_limits(int64_t memory, bool enforce_output) const;
};

}  // namespace arbiter
