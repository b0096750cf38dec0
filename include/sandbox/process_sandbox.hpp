#pragma once

#include <atomic>
#include <string>
#include "sandbox/sandbox.hpp"

namespace arbiter::sandbox {

/**
 * @brief 基于 fork/execve 的 Linux 沙箱
 *
 * 对每个请求：
 * 1. 在父进程中准备好 argv、环境变量、rlimit 和 landlock 规则集；
 * 2. fork 出子进程，子进程 setsid 后重定向标准流、进入工作目录、
 *    应用限制并 execve，任何一步失败都通过 CLOEXEC 的错误管道告知父进程；
 * 3. 父进程把子进程移入本次执行的 memory cgroup 后才允许子进程 execve；
 *    之后轮询输出管道，写入标准输入，检查墙钟时间、取消信号以及（没有 cgroup 时）常驻内存，
 *    需要时向整个进程组发送 SIGKILL；
 * 4. 子进程退出后杀死残留的后代进程，回收子进程并通过 rusage 统计 CPU 时间和内存。
 */
struct process_sandbox : public sandbox {
    /**
     * @param strict 为真时，请求的隔离手段不可用会抛出 sandbox_error，否则跳过该隔离
     * @param cgroup_parent 每次执行的 memory cgroup 创建在这个 cgroup 之下，需要对它有写权限
     */
    explicit process_sandbox(bool strict = false, std::string cgroup_parent = "arbiter");

    execution_report run(const execution_request &request, const cancellation_token *cancel = nullptr) override;

    const isolation_support &support() const override;

private:
    bool strict;
    std::string cgroup_parent;
    isolation_support isolation;
    std::atomic<unsigned> run_count{0};
};

}  // namespace arbiter::sandbox
