#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include "common/exceptions.hpp"

struct cgroup;

namespace arbiter::sandbox {

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public sandbox_error {
    /**
     * @param op 失败的 libcgroup 操作
     * @param err libcgroup 的返回值
     */
    cgroup_error(const std::string &op, int err);
};

/**
 * @brief 一次受限执行专属的 cgroup v2 子组，只使用 memory 控制器
 *
 * 构造时在内核中创建子组并写入 memory.max，超出限制时由内核在子组内触发 OOM killer，
 * 通过 memory.events 的 oom_kill 计数判断内存超限。
 * 析构时杀死组内残留的进程（包括脱离了进程组的后代进程）并删除子组。
 */
struct memory_cgroup {
    /**
     * @param name 相对于 cgroup 挂载点的路径，如 "arbiter/run_100_1"
     * @param limit memory.max（字节）
     * @throw cgroup_error 无法创建子组时
     */
    memory_cgroup(const std::string &name, int64_t limit);
    ~memory_cgroup();

    memory_cgroup(const memory_cgroup &) = delete;
    memory_cgroup &operator=(const memory_cgroup &) = delete;

    /**
     * @brief 将进程移入子组
     * @throw cgroup_error
     */
    void attach(pid_t pid);

    /**
     * @brief 子组内是否有进程因为超出 memory.max 被杀死
     */
    bool oom_killed() const;

    /**
     * @brief 子组的峰值内存用量（字节），内核没有 memory.peak 时返回 0
     */
    int64_t peak_usage() const;

    const std::string &name() const;

private:
    struct ::cgroup *cg = nullptr;
    std::string cgroup_name;

    // 子组在 cgroup 文件系统中的目录，libcgroup 不能读取 memory.events 这样的多行文件
    std::filesystem::path dir;

    void kill_all() const;
};

/**
 * @brief 初始化 libcgroup，并尝试在 parent 下创建一个带内存限制的子组
 * @return 当前进程是否可以通过 cgroup 限制子进程的内存
 */
bool probe_memory_cgroup(const std::string &parent);

}  // namespace arbiter::sandbox
