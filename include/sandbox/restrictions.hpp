#pragma once

#include <sys/resource.h>
#include <string>
#include <vector>
#include "sandbox/limits.hpp"

namespace arbiter::sandbox {

/**
 * @brief 内核对各种隔离手段的支持情况
 * 在沙箱构造时探测一次。
 */
struct isolation_support {
    enum class network_mode {
        /**
         * @brief 无法隔离网络
         */
        NONE,

        /**
         * @brief 可以直接 unshare(CLONE_NEWNET)（有 CAP_SYS_ADMIN）
         */
        NET_ONLY,

        /**
         * @brief 需要先进入新的用户命名空间才能 unshare(CLONE_NEWNET)
         */
        USER_AND_NET
    };

    network_mode network = network_mode::NONE;

    /**
     * @brief 内核支持的 landlock ABI 版本，0 表示不支持
     */
    int landlock_abi = 0;

    /**
     * @brief 是否可以为每次执行创建带 memory.max 的 cgroup，否则通过采样常驻内存限制内存
     */
    bool memory_cgroup = false;

    bool network_supported() const;
    bool filesystem_supported() const;
};

/**
 * @brief 探测当前内核支持的隔离手段
 * 网络隔离的探测需要 fork 一个子进程尝试 unshare。
 */
isolation_support probe_isolation();

/**
 * @brief 子进程中的失败阶段，通过错误管道传回父进程
 */
enum class child_stage : int {
    SIGNALS = 1,
    SETSID,
    CGROUP,
    REDIRECT,
    CHDIR,
    NETWORK,
    RLIMIT,
    FILESYSTEM,
    EXEC
};

const char *get_display_message(child_stage stage);

/**
 * @brief 子进程通过错误管道写回的失败信息
 */
struct child_failure {
    child_stage stage;
    int error;
};

/**
 * @brief 在 fork 之前准备好的限制措施
 * fork 之后的子进程只能调用异步信号安全的函数，因此所有需要分配内存、
 * 格式化字符串、打开目录的工作都在父进程中完成，子进程只调用 apply。
 *
 * 对象析构时关闭 landlock 规则集的文件描述符。
 */
struct prepared_restrictions {
    /**
     * @param limits 请求的资源限制
     * @param work_dir 唯一可写的目录
     * @param support 内核支持的隔离手段，不支持的隔离会被跳过
     * @throw std::system_error 创建 landlock 规则集失败时
     */
    prepared_restrictions(const resource_limits &limits, const std::filesystem::path &work_dir, const isolation_support &support);
    ~prepared_restrictions();

    prepared_restrictions(const prepared_restrictions &) = delete;
    prepared_restrictions &operator=(const prepared_restrictions &) = delete;

    /**
     * @brief 在子进程中应用所有限制，只调用异步信号安全的系统调用
     * @param failure 失败时写入失败的阶段和 errno
     * @return 是否全部成功
     */
    bool apply(child_failure &failure) const noexcept;

    bool restricts_network() const;
    bool restricts_filesystem() const;

private:
    struct rlimit_entry {
        int resource;
        struct rlimit value;
    };

    std::vector<rlimit_entry> rlimits;

    isolation_support::network_mode network_mode = isolation_support::network_mode::NONE;

    // 进入用户命名空间后写入 /proc/self/{uid_map,gid_map} 的内容，保持 uid/gid 不变
    std::string uid_map, gid_map;

    int ruleset_fd = -1;

    bool apply_network() const noexcept;
};

}  // namespace arbiter::sandbox
