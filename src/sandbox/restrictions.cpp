#include "sandbox/restrictions.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <linux/landlock.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/assign.hpp>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <system_error>
#include <unordered_map>

// glibc 没有提供 landlock 的包装函数，旧的头文件可能也没有系统调用号
#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

namespace arbiter::sandbox {
using namespace std;

// landlock ABI v1 中定义的全部文件系统访问权限
static const uint64_t LANDLOCK_FS_ALL_V1 =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
    LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

static const uint64_t LANDLOCK_FS_READ_FILE = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE;

static const uint64_t LANDLOCK_FS_READ_DIR = LANDLOCK_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

// clang-format off
static const unordered_map<child_stage, const char *> child_stage_string = boost::assign::map_list_of
    (child_stage::SIGNALS, "resetting signal handlers")
    (child_stage::SETSID, "creating session")
    (child_stage::CGROUP, "joining memory cgroup")
    (child_stage::REDIRECT, "redirecting standard streams")
    (child_stage::CHDIR, "changing to working directory")
    (child_stage::NETWORK, "isolating network")
    (child_stage::RLIMIT, "setting resource limits")
    (child_stage::FILESYSTEM, "restricting filesystem")
    (child_stage::EXEC, "executing command");
// clang-format on

const char *get_display_message(child_stage stage) {
    auto it = child_stage_string.find(stage);
    return it == child_stage_string.end() ? "unknown stage" : it->second;
}

bool isolation_support::network_supported() const {
    return network != network_mode::NONE;
}

bool isolation_support::filesystem_supported() const {
    return landlock_abi >= 1;
}

static int landlock_create_ruleset(const struct landlock_ruleset_attr *attr, size_t size, uint32_t flags) {
    return (int)syscall(__NR_landlock_create_ruleset, attr, size, flags);
}

static int landlock_add_rule(int ruleset_fd, enum landlock_rule_type type, const void *attr, uint32_t flags) {
    return (int)syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags);
}

static int landlock_restrict_self(int ruleset_fd, uint32_t flags) {
    return (int)syscall(__NR_landlock_restrict_self, ruleset_fd, flags);
}

static bool write_proc_file(const char *path, const string &content) noexcept {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = write(fd, content.data(), content.size());
    int saved = errno;
    close(fd);
    errno = saved;
    return n == (ssize_t)content.size();
}

/**
 * @brief 在一个临时子进程中尝试进入新的网络命名空间
 * @return 子进程是否成功
 */
static bool probe_unshare(int flags) {
    pid_t pid = fork();
    if (pid < 0) {
        PLOG(WARNING) << "Unable to fork network isolation probe";
        return false;
    }
    if (pid == 0) _exit(unshare(flags) == 0 ? 0 : 1);

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

isolation_support probe_isolation() {
    isolation_support support;

    int abi = landlock_create_ruleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    support.landlock_abi = abi < 0 ? 0 : abi;

    if (probe_unshare(CLONE_NEWNET))
        support.network = isolation_support::network_mode::NET_ONLY;
    else if (probe_unshare(CLONE_NEWUSER | CLONE_NEWNET))
        support.network = isolation_support::network_mode::USER_AND_NET;

    if (support.filesystem_supported())
        LOG(INFO) << "Filesystem isolation available (landlock ABI " << support.landlock_abi << ")";
    else
        LOG(WARNING) << "Filesystem isolation unavailable: kernel does not support landlock";

    switch (support.network) {
        case isolation_support::network_mode::NET_ONLY:
            LOG(INFO) << "Network isolation available";
            break;
        case isolation_support::network_mode::USER_AND_NET:
            LOG(INFO) << "Network isolation available through user namespaces";
            break;
        default:
            LOG(WARNING) << "Network isolation unavailable: unable to create network namespace";
            break;
    }
    return support;
}

prepared_restrictions::prepared_restrictions(const resource_limits &limits, const filesystem::path &work_dir, const isolation_support &support) {
    auto add_rlimit = [this](int resource, rlim_t cur, rlim_t max) {
        rlimit_entry entry;
        entry.resource = resource;
        entry.value.rlim_cur = cur;
        entry.value.rlim_max = max;
        rlimits.push_back(entry);
    };

    if (limits.cpu_timeout.count() > 0) {
        // 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，
        // 可以据此可靠地判断 CPU 时间超限
        rlim_t cputime_limit = (rlim_t)ceil(limits.cpu_timeout.count() / 1000.0);
        add_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }
    // 内存由沙箱的 cgroup 或者常驻内存采样限制，这里不设置 RLIMIT_AS
    if (limits.file_size_limit > 0) add_rlimit(RLIMIT_FSIZE, limits.file_size_limit, limits.file_size_limit);
    if (limits.proc_limit > 0) add_rlimit(RLIMIT_NPROC, limits.proc_limit, limits.proc_limit);
    add_rlimit(RLIMIT_CORE, 0, 0);

    if (limits.restrict_network) {
        network_mode = support.network;
        if (network_mode == isolation_support::network_mode::USER_AND_NET) {
            uid_map = fmt::format("{0} {0} 1\n", getuid());
            gid_map = fmt::format("{0} {0} 1\n", getgid());
        }
    }

    if (limits.restrict_filesystem && support.filesystem_supported()) {
        struct landlock_ruleset_attr ruleset_attr;
        memset(&ruleset_attr, 0, sizeof(ruleset_attr));
        ruleset_attr.handled_access_fs = LANDLOCK_FS_ALL_V1;

        ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
        if (ruleset_fd < 0) throw system_error(errno, system_category(), "unable to create landlock ruleset");

        auto add_rule = [this](const filesystem::path &path, uint64_t dir_access, uint64_t file_access) {
            int fd = open(path.c_str(), O_PATH | O_CLOEXEC);
            if (fd < 0) {
                // 不存在的只读路径直接跳过，比如没有 /lib64 的系统
                if (errno == ENOENT) return;
                throw system_error(errno, system_category(), "unable to open " + path.string());
            }
            struct stat st;
            if (fstat(fd, &st) != 0) {
                int saved = errno;
                close(fd);
                throw system_error(saved, system_category(), "unable to stat " + path.string());
            }

            struct landlock_path_beneath_attr path_beneath;
            memset(&path_beneath, 0, sizeof(path_beneath));
            path_beneath.parent_fd = fd;
            // 目录专属的权限不能赋予普通文件
            path_beneath.allowed_access = S_ISDIR(st.st_mode) ? dir_access : file_access;

            int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_beneath, 0);
            int saved = errno;
            close(fd);
            if (ret != 0) throw system_error(saved, system_category(), "unable to add landlock rule for " + path.string());
        };

        try {
            for (auto &path : limits.read_only_paths)
                add_rule(path, LANDLOCK_FS_READ_DIR, LANDLOCK_FS_READ_FILE);
            add_rule(work_dir, LANDLOCK_FS_ALL_V1, LANDLOCK_FS_READ_FILE | LANDLOCK_ACCESS_FS_WRITE_FILE);
        } catch (...) {
            close(ruleset_fd);
            ruleset_fd = -1;
            throw;
        }
    }
}

prepared_restrictions::~prepared_restrictions() {
    if (ruleset_fd >= 0) close(ruleset_fd);
}

bool prepared_restrictions::restricts_network() const {
    return network_mode != isolation_support::network_mode::NONE;
}

bool prepared_restrictions::restricts_filesystem() const {
    return ruleset_fd >= 0;
}

bool prepared_restrictions::apply_network() const noexcept {
    switch (network_mode) {
        case isolation_support::network_mode::NET_ONLY:
            return unshare(CLONE_NEWNET) == 0;
        case isolation_support::network_mode::USER_AND_NET:
            if (unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) return false;
            // 不建立映射的话，工作目录的属主在新的用户命名空间中会变成 nobody
            if (!write_proc_file("/proc/self/setgroups", "deny")) return false;
            if (!write_proc_file("/proc/self/gid_map", gid_map)) return false;
            return write_proc_file("/proc/self/uid_map", uid_map);
        default:
            return true;
    }
}

bool prepared_restrictions::apply(child_failure &failure) const noexcept {
    if (!apply_network()) {
        failure = {child_stage::NETWORK, errno};
        return false;
    }

    for (auto &entry : rlimits) {
        if (setrlimit(entry.resource, &entry.value) != 0) {
            failure = {child_stage::RLIMIT, errno};
            return false;
        }
    }

    if (ruleset_fd >= 0) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0 || landlock_restrict_self(ruleset_fd, 0) != 0) {
            failure = {child_stage::FILESYSTEM, errno};
            return false;
        }
    }
    return true;
}

}  // namespace arbiter::sandbox
