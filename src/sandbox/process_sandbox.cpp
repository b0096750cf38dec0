#include "sandbox/process_sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/cgroup.hpp"

namespace arbiter::sandbox {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const size_t BUF_SIZE = 65536;

// 监控循环的轮询间隔，决定了超时和取消的响应精度
const chrono::milliseconds POLL_INTERVAL(10);

// 子进程退出后，继续等待输出管道关闭的最长时间
const chrono::milliseconds DRAIN_GRACE(200);

static void error(int err, const string &what) {
    throw system_error(err, system_category(), what);
}

namespace {

/**
 * @brief 一对 O_CLOEXEC 的管道，析构时关闭尚未关闭的一端
 */
struct pipe_guard {
    int fd[2] = {-1, -1};

    pipe_guard() {
        if (pipe2(fd, O_CLOEXEC) != 0) error(errno, "creating pipe");
    }

    ~pipe_guard() {
        close_end(PIPE_READ);
        close_end(PIPE_WRITE);
    }

    pipe_guard(const pipe_guard &) = delete;
    pipe_guard &operator=(const pipe_guard &) = delete;

    void close_end(int end) {
        if (fd[end] >= 0) {
            close(fd[end]);
            fd[end] = -1;
        }
    }

    void set_nonblocking(int end) {
        int flags = fcntl(fd[end], F_GETFL);
        if (flags == -1 || fcntl(fd[end], F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "setting pipe non-blocking");
    }
};

/**
 * @brief fork 后子进程需要的全部数据，都在 fork 前准备好
 */
struct child_context {
    const char *executable;
    char *const *argv;
    char *const *envp;
    const char *work_dir;
    int stdin_fd, stdout_fd, stderr_fd, error_fd;

    // 父进程把子进程移入 cgroup 后写入一个字节，子进程读到后才继续执行
    int start_fd, start_write_fd;
    const prepared_restrictions *restrictions;
};

[[noreturn]] void child_fail(int error_fd, child_failure failure) noexcept {
    ssize_t ignored = write(error_fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

/**
 * @brief 子进程的入口，fork 之后只能调用异步信号安全的函数
 */
[[noreturn]] void child_main(const child_context &ctx) noexcept {
    child_failure failure;

    // 父进程忽略了 SIGPIPE，其他线程也可能屏蔽了一些信号，都不能被选手程序继承
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigset_t emptymask;
    sigemptyset(&emptymask);
    if (sigaction(SIGPIPE, &sa, nullptr) != 0 || sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0)
        child_fail(ctx.error_fd, {child_stage::SIGNALS, errno});

    // 在新的会话中运行，这样命令和它创建的所有子进程可以被一个信号杀死
    if (setsid() == -1)
        child_fail(ctx.error_fd, {child_stage::SETSID, errno});

    close(ctx.start_write_fd);
    char go;
    ssize_t n;
    do {
        n = read(ctx.start_fd, &go, 1);
    } while (n < 0 && errno == EINTR);
    if (n != 1)
        child_fail(ctx.error_fd, {child_stage::CGROUP, n == 0 ? ECANCELED : errno});

    if (dup2(ctx.stdin_fd, STDIN_FILENO) < 0 ||
        dup2(ctx.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(ctx.stderr_fd, STDERR_FILENO) < 0)
        child_fail(ctx.error_fd, {child_stage::REDIRECT, errno});

    if (chdir(ctx.work_dir) != 0)
        child_fail(ctx.error_fd, {child_stage::CHDIR, errno});

    if (!ctx.restrictions->apply(failure))
        child_fail(ctx.error_fd, failure);

    execve(ctx.executable, ctx.argv, ctx.envp);
    child_fail(ctx.error_fd, {child_stage::EXEC, errno});
}

/**
 * @brief 在 fork 之前确定可执行文件的路径，找不到时视为启动失败
 */
bool resolve_executable(const string &command, const fs::path &work_dir, const string &search_path, string &resolved, string &reason) {
    if (command.find('/') != string::npos) {
        fs::path path(command);
        if (path.is_relative()) path = work_dir / path;
        if (access(path.c_str(), X_OK) == 0) {
            resolved = path.string();
            return true;
        }
        reason = fmt::format("{}: {}", command, strerror(errno));
        return false;
    }

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path path = fs::path(dir) / command;
        if (access(path.c_str(), X_OK) == 0 && !fs::is_directory(path)) {
            resolved = path.string();
            return true;
        }
    }
    reason = fmt::format("{}: command not found", command);
    return false;
}

/**
 * @brief 进程当前的常驻内存（字节），进程已经退出时返回 0
 */
int64_t resident_bytes(pid_t pid) {
    ifstream fin(fmt::format("/proc/{}/statm", pid));
    int64_t size = 0, resident = 0;
    if (!(fin >> size >> resident)) return 0;
    return resident * sysconf(_SC_PAGESIZE);
}

/**
 * @brief 从管道中读取一次数据，超出上限的部分只计数不保存
 * @return 管道是否仍然打开
 */
bool pump_stream(int fd, captured_stream &stream, size_t limit, char *buffer) {
    ssize_t nread = read(fd, buffer, BUF_SIZE);
    if (nread < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "reading child output");
    }
    if (nread == 0) return false;

    stream.total_bytes += nread;
    size_t keep = nread;
    if (limit > 0) {
        size_t room = limit > stream.data.size() ? limit - stream.data.size() : 0;
        if (keep > room) {
            keep = room;
            stream.truncated = true;
        }
    }
    stream.data.append(buffer, keep);
    return true;
}

}  // namespace

process_sandbox::process_sandbox(bool strict, string cgroup_parent) : strict(strict), cgroup_parent(move(cgroup_parent)) {
    // 向已经退出的子进程写标准输入时会收到 SIGPIPE，我们通过 EPIPE 处理
    signal(SIGPIPE, SIG_IGN);
    isolation = probe_isolation();
    isolation.memory_cgroup = probe_memory_cgroup(this->cgroup_parent);
}

const isolation_support &process_sandbox::support() const {
    return isolation;
}

execution_report process_sandbox::run(const execution_request &request, const cancellation_token *cancel) {
    const resource_limits &limits = request.limits;
    execution_report report;

    if (request.command.empty()) throw invalid_argument("command to execute is empty");

    if (strict && limits.restrict_network && !isolation.network_supported())
        throw sandbox_error("network isolation is required but not supported by this kernel");
    if (strict && limits.restrict_filesystem && !isolation.filesystem_supported())
        throw sandbox_error("filesystem isolation is required but not supported by this kernel");

    string search_path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    string executable;
    if (!resolve_executable(request.command[0], request.work_dir, search_path, executable, report.spawn_error)) {
        LOG(WARNING) << "Unable to start command: " << report.spawn_error;
        return report;
    }

    // 子进程只能看到 PATH、HOME 和请求中指定的环境变量
    map<string, string> env = {{"PATH", search_path}, {"HOME", request.work_dir.string()}};
    for (auto &[key, value] : request.env) env[key] = value;

    vector<string> env_entries;
    for (auto &[key, value] : env) env_entries.push_back(key + "=" + value);
    vector<string> args = request.command;

    vector<char *> c_argv, c_envp;
    for (auto &arg : args) c_argv.push_back(arg.data());
    c_argv.push_back(nullptr);
    for (auto &entry : env_entries) c_envp.push_back(entry.data());
    c_envp.push_back(nullptr);

    string work_dir = request.work_dir.string();
    prepared_restrictions restrictions(limits, request.work_dir, isolation);

    unique_ptr<memory_cgroup> group;
    if (limits.memory_limit > 0 && isolation.memory_cgroup) {
        try {
            group = make_unique<memory_cgroup>(fmt::format("{}/run_{}_{}", cgroup_parent, getpid(), ++run_count), limits.memory_limit);
        } catch (cgroup_error &e) {
            LOG(WARNING) << "Sampling memory of " << request.command[0] << " instead of using cgroup: " << e.what();
        }
    }

    pipe_guard stdin_pipe, stdout_pipe, stderr_pipe, error_pipe, start_pipe;

    child_context ctx;
    ctx.executable = executable.c_str();
    ctx.argv = c_argv.data();
    ctx.envp = c_envp.data();
    ctx.work_dir = work_dir.c_str();
    ctx.stdin_fd = stdin_pipe.fd[PIPE_READ];
    ctx.stdout_fd = stdout_pipe.fd[PIPE_WRITE];
    ctx.stderr_fd = stderr_pipe.fd[PIPE_WRITE];
    ctx.error_fd = error_pipe.fd[PIPE_WRITE];
    ctx.start_fd = start_pipe.fd[PIPE_READ];
    ctx.start_write_fd = start_pipe.fd[PIPE_WRITE];
    ctx.restrictions = &restrictions;

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid < 0) error(errno, "unable to fork");
    if (child_pid == 0) child_main(ctx);

    // 无论以何种方式离开这个函数，子进程都必须被杀死并回收
    bool reaped = false;
    defer {
        if (reaped) return;
        kill(-child_pid, SIGKILL);
        kill(child_pid, SIGKILL);
        while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {}
    };

    stdin_pipe.close_end(PIPE_READ);
    stdout_pipe.close_end(PIPE_WRITE);
    stderr_pipe.close_end(PIPE_WRITE);
    error_pipe.close_end(PIPE_WRITE);
    start_pipe.close_end(PIPE_READ);

    if (group) {
        try {
            group->attach(child_pid);
        } catch (cgroup_error &e) {
            LOG(WARNING) << "Sampling memory of " << request.command[0] << " instead of using cgroup: " << e.what();
            group.reset();
        }
    }
    char go = 1;
    ssize_t sent;
    do {
        sent = write(start_pipe.fd[PIPE_WRITE], &go, 1);
    } while (sent < 0 && errno == EINTR);
    // EPIPE：子进程已经退出，原因通过错误管道读取
    if (sent < 0 && errno != EPIPE) error(errno, "starting child");
    start_pipe.close_end(PIPE_WRITE);

    // execve 成功后错误管道因为 CLOEXEC 被关闭，读到 EOF
    child_failure failure;
    ssize_t nread;
    do {
        nread = read(error_pipe.fd[PIPE_READ], &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);
    if (nread < 0) error(errno, "reading child status");
    if (nread == sizeof(failure)) {
        while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR) {}
        reaped = true;
        report.spawn_error = fmt::format("{}: {}", get_display_message(failure.stage), strerror(failure.error));
        report.wall_time = timer.duration<chrono::milliseconds>();
        LOG(WARNING) << "Unable to start command " << request.command[0] << ": " << report.spawn_error;
        return report;
    }
    report.spawned = true;

    stdout_pipe.set_nonblocking(PIPE_READ);
    stderr_pipe.set_nonblocking(PIPE_READ);
    if (request.stdin_data.empty())
        stdin_pipe.close_end(PIPE_WRITE);
    else
        stdin_pipe.set_nonblocking(PIPE_WRITE);

    int &stdin_fd = stdin_pipe.fd[PIPE_WRITE];
    int &stdout_fd = stdout_pipe.fd[PIPE_READ];
    int &stderr_fd = stderr_pipe.fd[PIPE_READ];

    auto start = chrono::steady_clock::now();
    auto deadline = limits.wall_timeout.count() > 0 ? start + limits.wall_timeout : chrono::steady_clock::time_point::max();
    chrono::steady_clock::time_point exit_time;
    bool exited = false, killed = false;
    int64_t sampled_peak = 0;
    size_t stdin_offset = 0;
    vector<char> buffer(BUF_SIZE);

    auto kill_group = [&] {
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            PLOG(ERROR) << "Unable to send SIGKILL to process group " << child_pid;
    };

    auto terminate = [&](limit_violation violation) {
        if (killed) return;
        killed = true;
        report.violation = violation;
        kill_group();
    };

    while (true) {
        auto now = chrono::steady_clock::now();

        if (!exited) {
            // WNOWAIT 保留僵尸进程，这样进程组 id 在杀死残留的后代进程之前不会被复用
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
                if (errno != EINTR) error(errno, "waiting on child");
            } else if (info.si_pid == child_pid) {
                exited = true;
                exit_time = now;
                kill_group();
            }
        }

        if (exited && ((stdout_fd < 0 && stderr_fd < 0) || now - exit_time > DRAIN_GRACE)) {
            if (stdout_fd >= 0 || stderr_fd >= 0)
                LOG(WARNING) << "Output of command " << request.command[0] << " is still held open by an escaped process";
            break;
        }

        if (!exited && !killed) {
            if (now >= deadline) {
                LOG(WARNING) << fmt::format("Command {} exceeded wall-time limit of {}ms", request.command[0], limits.wall_timeout.count());
                terminate(limit_violation::WALL_TIME);
            } else if (cancel && cancel->is_cancelled()) {
                LOG(INFO) << "Command " << request.command[0] << " cancelled";
                report.cancelled = true;
                terminate(limit_violation::NONE);
            } else if (!group && limits.memory_limit > 0) {
                sampled_peak = max(sampled_peak, resident_bytes(child_pid));
                if (sampled_peak > limits.memory_limit) {
                    LOG(WARNING) << fmt::format("Command {} exceeded memory limit of {} bytes", request.command[0], limits.memory_limit);
                    terminate(limit_violation::MEMORY);
                }
            }
        }

        struct pollfd fds[3];
        int nfds = 0, out_idx = -1, err_idx = -1, in_idx = -1;
        auto watch = [&](int fd, short events) {
            fds[nfds].fd = fd;
            fds[nfds].events = events;
            fds[nfds].revents = 0;
            return nfds++;
        };
        if (stdout_fd >= 0) out_idx = watch(stdout_fd, POLLIN);
        if (stderr_fd >= 0) err_idx = watch(stderr_fd, POLLIN);
        if (stdin_fd >= 0) in_idx = watch(stdin_fd, POLLOUT);

        if (nfds == 0) {
            this_thread::sleep_for(POLL_INTERVAL);
            continue;
        }

        int r = poll(fds, nfds, (int)POLL_INTERVAL.count());
        if (r < 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)) &&
            !pump_stream(stdout_fd, report.out, limits.output_limit, buffer.data()))
            stdout_pipe.close_end(PIPE_READ);

        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR)) &&
            !pump_stream(stderr_fd, report.err, limits.output_limit, buffer.data()))
            stderr_pipe.close_end(PIPE_READ);

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLHUP | POLLERR))) {
            ssize_t nwritten = write(stdin_fd, request.stdin_data.data() + stdin_offset, request.stdin_data.size() - stdin_offset);
            if (nwritten >= 0) {
                stdin_offset += nwritten;
                if (stdin_offset >= request.stdin_data.size()) stdin_pipe.close_end(PIPE_WRITE);
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // EPIPE：子进程不再读取标准输入，剩余的数据被丢弃
                stdin_pipe.close_end(PIPE_WRITE);
            }
        }

        if (limits.enforce_output_limit && limits.output_limit > 0 &&
            (report.out.total_bytes > limits.output_limit || report.err.total_bytes > limits.output_limit)) {
            if (!killed) LOG(WARNING) << fmt::format("Command {} exceeded output limit of {} bytes", request.command[0], limits.output_limit);
            terminate(limit_violation::OUTPUT);
        }
    }

    stdin_pipe.close_end(PIPE_WRITE);
    stdout_pipe.close_end(PIPE_READ);
    stderr_pipe.close_end(PIPE_READ);

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(child_pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "reaping child");
    }
    reaped = true;

    report.wall_time = chrono::duration_cast<chrono::milliseconds>(exit_time - start);
    report.cpu_time = chrono::milliseconds(
        (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
        (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000);
    // Linux 上 ru_maxrss 以 KB 为单位
    report.memory_bytes = max((int64_t)usage.ru_maxrss * 1024, sampled_peak);
    if (group) report.memory_bytes = max(report.memory_bytes, group->peak_usage());

    if (WIFEXITED(status)) {
        report.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        report.signal = WTERMSIG(status);
        report.exit_code = 128 + report.signal;
    }

    if (report.violation != limit_violation::WALL_TIME) {
        bool cpu_exceeded = report.signal == SIGXCPU ||
                            (report.signal == SIGKILL && !killed && limits.cpu_timeout.count() > 0 && report.cpu_time >= limits.cpu_timeout);
        bool memory_exceeded = report.violation == limit_violation::MEMORY || (group && group->oom_killed());
        // 采样可能错过两次采样之间分配后立即退出的峰值，由 ru_maxrss 补上
        if (!group && limits.memory_limit > 0 && report.memory_bytes > limits.memory_limit)
            memory_exceeded = true;

        if (cpu_exceeded)
            report.violation = limit_violation::CPU_TIME;
        else if (memory_exceeded)
            report.violation = limit_violation::MEMORY;
        else if (report.signal == SIGXFSZ)
            report.violation = limit_violation::OUTPUT;
    }

    if (report.violation != limit_violation::NONE)
        LOG(WARNING) << fmt::format("Command {} exceeded {} limit (exit code {}, {}ms, {} bytes)",
                                    request.command[0], get_display_message(report.violation),
                                    report.exit_code, report.wall_time.count(), report.memory_bytes);
    return report;
}

}  // namespace arbiter::sandbox
