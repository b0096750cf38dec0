#include "server/events.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

namespace {

struct event_kind_visitor {
    const char *operator()(const submission_queued &) const { return "submission_queued"; }
    const char *operator()(const submission_finalized &) const { return "submission_finalized"; }
    const char *operator()(const test_evaluation &) const { return "test_evaluation"; }
    const char *operator()(const score_update &) const { return "score_update"; }
    const char *operator()(const announcement &) const { return "announcement"; }
    const char *operator()(const paused &) const { return "paused"; }
    const char *operator()(const unpaused &) const { return "unpaused"; }
    const char *operator()(const check_in &) const { return "check_in"; }
};

struct event_json_visitor {
    json &j;

    void operator()(const submission_queued &e) const {
        j["submission_id"] = e.submission_id;
        j["submitter"] = e.submitter;
        j["problem"] = e.problem;
        j["time"] = format_time(e.time);
    }

    void operator()(const submission_finalized &e) const {
        j["submission_id"] = e.submission_id;
        j["submitter"] = e.submitter;
        j["problem"] = e.problem;
        j["problem_title"] = e.problem_title;
        j["state"] = get_display_message(e.state);
        j["passed"] = e.passed;
        j["failed"] = e.failed;
        j["score"] = e.score;
        j["success"] = e.success;
        j["time"] = format_time(e.time);
    }

    void operator()(const test_evaluation &e) const {
        j["submitter"] = e.submitter;
        j["problem"] = e.problem;
        j["problem_title"] = e.problem_title;
        j["passed"] = e.passed;
        j["failed"] = e.failed;
        j["score"] = e.score;
        j["time"] = format_time(e.time);
    }

    void operator()(const score_update &e) const {
        json states = json::array();
        for (auto state : e.states) states.push_back(get_display_message(state));
        j["submitter"] = e.submitter;
        j["score"] = e.score;
        j["states"] = states;
        j["time"] = format_time(e.time);
    }

    void operator()(const announcement &e) const {
        j["announcer"] = e.announcer;
        j["message"] = e.message;
        j["time"] = format_time(e.time);
    }

    void operator()(const paused &e) const {
        j["paused_by"] = e.paused_by;
        j["time"] = format_time(e.time);
    }

    void operator()(const unpaused &e) const {
        j["unpaused_by"] = e.unpaused_by;
        j["time"] = format_time(e.time);
    }

    void operator()(const check_in &e) const {
        j["name"] = e.name;
        j["time"] = format_time(e.time);
    }
};

}  // namespace

const char *event_kind(const server_event &event) {
    return visit(event_kind_visitor{}, event);
}

string format_time(event_time time) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(chrono::system_clock::to_time_t(time)));
}

void to_json(json &j, const server_event &event) {
    j = json::object();
    j["kind"] = event_kind(event);
    visit(event_json_visitor{j}, event);
}

event_publisher::~event_publisher() = default;

}  // namespace arbiter::server
