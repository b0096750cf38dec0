#include "server/clock.hpp"
#include <glog/logging.h>

namespace arbiter::server {
using namespace std;

competition_clock::competition_clock(event_publisher *publisher, optional<chrono::milliseconds> time_limit)
    : publisher(publisher), time_limit(time_limit), start_time(clock::now()), total_paused(0) {}

bool competition_clock::pause(const string &by) {
    scoped_lock lock(mut);
    if (pause_time) return false;
    pause_time = clock::now();
    LOG(INFO) << "Competition paused by " << by;
    if (publisher) publisher->publish(paused{by, chrono::system_clock::now()});
    return true;
}

bool competition_clock::unpause(const string &by) {
    scoped_lock lock(mut);
    if (!pause_time) return false;
    total_paused += clock::now() - *pause_time;
    pause_time.reset();
    LOG(INFO) << "Competition unpaused by " << by;
    if (publisher) publisher->publish(unpaused{by, chrono::system_clock::now()});
    return true;
}

bool competition_clock::is_paused() const {
    scoped_lock lock(mut);
    return pause_time.has_value();
}

clock_state competition_clock::state() const {
    scoped_lock lock(mut);
    auto now = clock::now();
    auto paused_for = total_paused;
    if (pause_time) paused_for += now - *pause_time;

    clock_state result;
    result.paused = pause_time.has_value();
    result.elapsed = chrono::duration_cast<chrono::milliseconds>(now - start_time - paused_for);
    result.total_paused = chrono::duration_cast<chrono::milliseconds>(paused_for);
    if (time_limit)
        result.remaining = max(chrono::milliseconds(0), *time_limit - result.elapsed);
    return result;
}

}  // namespace arbiter::server
