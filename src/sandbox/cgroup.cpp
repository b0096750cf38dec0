#include "sandbox/cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>

namespace arbiter::sandbox {
using namespace std;
namespace fs = std::filesystem;

static string describe(const string &op, int err) {
    // ECGOTHER 表示 libcgroup 内部的系统调用失败，原因保存在 errno 中
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", op, strerror(cgroup_get_last_errno()));
    return fmt::format("libcgroup: {}: {}", op, cgroup_strerror(err));
}

cgroup_error::cgroup_error(const string &op, int err) : sandbox_error(describe(op, err)) {}

static void ensure(const string &op, int err) {
    if (err != 0) throw cgroup_error(op, err);
}

memory_cgroup::memory_cgroup(const string &name, int64_t limit) : cgroup_name(name) {
    cg = cgroup_new_cgroup(name.c_str());
    if (!cg) throw cgroup_error(fmt::format("cgroup_new_cgroup({})", name), ECGOTHER);

    struct cgroup_controller *ctrl = cgroup_add_controller(cg, "memory");
    int ret = ctrl ? cgroup_add_value_int64(ctrl, "memory.max", limit) : ECGOTHER;
    if (ret == 0) ret = cgroup_create_cgroup(cg, 0);
    if (ret != 0) {
        cgroup_free(&cg);
        throw cgroup_error(fmt::format("creating {} with memory.max={}", name, limit), ret);
    }

    char *mount_point = nullptr;
    if (cgroup_get_subsys_mount_point("memory", &mount_point) == 0 && mount_point) {
        dir = fs::path(mount_point) / name;
        free(mount_point);
    }
}

memory_cgroup::~memory_cgroup() {
    kill_all();
    int ret = cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE);
    if (ret != 0) LOG(WARNING) << describe("deleting " + cgroup_name, ret);
    cgroup_free(&cg);
}

void memory_cgroup::attach(pid_t pid) {
    ensure(fmt::format("cgroup_attach_task_pid({}, {})", cgroup_name, pid), cgroup_attach_task_pid(cg, pid));
}

bool memory_cgroup::oom_killed() const {
    if (dir.empty()) return false;
    ifstream fin(dir / "memory.events");
    string key;
    int64_t count;
    while (fin >> key >> count)
        if (key == "oom_kill") return count > 0;
    return false;
}

int64_t memory_cgroup::peak_usage() const {
    if (dir.empty()) return 0;
    ifstream fin(dir / "memory.peak");
    int64_t peak = 0;
    if (!(fin >> peak)) return 0;
    return peak;
}

const string &memory_cgroup::name() const {
    return cgroup_name;
}

void memory_cgroup::kill_all() const {
    if (dir.empty()) return;
    // cgroup.kill 需要 5.14 以上的内核，旧内核上残留的进程会导致删除子组失败
    ofstream fout(dir / "cgroup.kill");
    fout << 1;
    if (!fout) DLOG(INFO) << "Unable to write " << (dir / "cgroup.kill");
}

bool probe_memory_cgroup(const string &parent) {
    static once_flag init_flag;
    static int init_result;
    call_once(init_flag, [] { init_result = cgroup_init(); });
    if (init_result != 0) {
        LOG(WARNING) << "Memory cgroup unavailable, " << describe("cgroup_init", init_result);
        return false;
    }

    try {
        memory_cgroup probe(fmt::format("{}/probe_{}", parent, getpid()), 64ll << 20);
        LOG(INFO) << "Memory limits enforced by cgroup under " << parent;
        return true;
    } catch (cgroup_error &e) {
        LOG(WARNING) << "Memory cgroup unavailable, memory usage will be sampled instead: " << e.what();
        return false;
    }
}

}  // namespace arbiter::sandbox
