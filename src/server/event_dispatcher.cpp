#include "server/event_dispatcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

event_dispatcher::~event_dispatcher() {
    stop();
}

void event_dispatcher::add_handler(handler h, string name) {
    scoped_lock lock(mut);
    if (started) throw internal_error("handlers must be registered before the dispatcher starts");
    auto ch = make_unique<channel>();
    ch->name = move(name);
    ch->h = move(h);
    channels.push_back(move(ch));
}

void event_dispatcher::start() {
    scoped_lock lock(mut);
    if (started) return;
    started = true;
    for (auto &ch : channels) {
        channel &c = *ch;
        c.worker = thread([&c] { run(c); });
    }
}

void event_dispatcher::stop() {
    {
        scoped_lock lock(mut);
        stopped = true;
        for (auto &ch : channels) ch->queue.close();
    }
    for (auto &ch : channels)
        if (ch->worker.joinable()) ch->worker.join();
}

void event_dispatcher::publish(const server_event &event) {
    scoped_lock lock(mut);
    if (stopped) {
        LOG(WARNING) << "Event dispatcher is stopped, dropping " << event_kind(event) << " event";
        return;
    }
    for (auto &ch : channels) ch->queue.push(event);
}

void event_dispatcher::run(channel &ch) {
    while (auto event = ch.queue.pop()) {
        DLOG(INFO) << "Dispatching " << event_kind(*event) << " event to " << ch.name;
        try {
            ch.h(*event);
        } catch (exception &e) {
            LOG(ERROR) << "Error handling " << event_kind(*event) << " event in " << ch.name << ": " << e.what();
        }
    }
}

command_hook::command_hook(sandbox::sandbox &executor, filesystem::path executable, chrono::milliseconds timeout)
    : executor(executor), executable(move(executable)), timeout(timeout) {}

void command_hook::operator()(const server_event &event) const {
    json j;
    to_json(j, event);
    string kind = event_kind(event);

    sandbox::execution_request request;
    request.command = {executable.string(), kind};
    request.work_dir = filesystem::current_path();
    request.env["ARBITER_EVENT"] = j.dump();
    request.limits.wall_timeout = timeout;
    request.limits.output_limit = 64 << 10;
    request.limits.enforce_output_limit = false;

    auto report = executor.run(request);
    if (!report.spawned)
        throw runtime_error(fmt::format("event hook {} could not start: {}", executable.string(), report.spawn_error));
    if (report.violation == limit_violation::WALL_TIME)
        throw runtime_error(fmt::format("event hook {} timed out after {}ms", executable.string(), timeout.count()));
    if (report.exit_code != 0)
        throw runtime_error(fmt::format("event hook {} exited with {}: {}", executable.string(), report.exit_code, report.err.data));
}

}  // namespace arbiter::server
