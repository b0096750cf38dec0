#include "server/competition_server.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "server/leaderboard.hpp"
#include "server/submitter_view.hpp"

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

static json error_response(const string &message) {
    return {{"error", message}};
}

static json progress_json(const live_progress &progress) {
    return {{"id", progress.id},
            {"submitter", progress.submitter},
            {"problem", progress.problem},
            {"kind", progress.kind == admission_kind::SUBMISSION ? "submission" : "test_run"},
            {"state", get_display_message(progress.state)},
            {"completed", progress.completed},
            {"total", progress.total}};
}

static json clock_json(const clock_state &state) {
    json j = {{"paused", state.paused},
              {"elapsed", state.elapsed.count()},
              {"total_paused", state.total_paused.count()}};
    if (state.remaining)
        j["remaining"] = state.remaining->count();
    else
        j["remaining"] = nullptr;
    return j;
}

competition_server::competition_server(competition_config config, unique_ptr<sandbox::sandbox> executor,
                                       unique_ptr<submission_store> store, filesystem::path scratch_root,
                                       bool keep_scratch)
    : conf(move(config)),
      executor(move(executor)),
      records(move(store)),
      timer(&dispatcher, conf.duration),
      runner(*this->executor, conf.test_runner, conf.sandbox, move(scratch_root), keep_scratch),
      judge(conf, runner, registry, *records, dispatcher) {
    dispatcher.add_handler([this](const server_event &event) { subscribers(event); }, "subscribers");
    for (auto &hook : conf.event_hooks) {
        LOG(INFO) << "Registered event hook " << hook << " with timeout " << conf.hook_timeout.count() << "ms";
        dispatcher.add_handler(command_hook(*this->executor, hook, conf.hook_timeout), "hook " + hook.string());
    }
}

competition_server::~competition_server() {
    judge.shutdown();
    dispatcher.stop();
}

void competition_server::start() {
    dispatcher.start();
}

void competition_server::shutdown() {
    LOG(INFO) << "Shutting down, cancelling " << registry.size() << " in-flight submissions";
    judge.shutdown();
}

void competition_server::stop() {
    dispatcher.stop();
}

json competition_server::handle(const json &request) {
    string kind;
    try {
        kind = request.at("kind").get<string>();

        if (kind == "submit") return handle_submission(request, false);
        if (kind == "test") return handle_submission(request, true);

        if (kind == "announce") {
            dispatcher.publish(announcement{request.at("announcer").get<string>(), request.at("message").get<string>(),
                                            chrono::system_clock::now()});
            return {{"ok", true}};
        }
        if (kind == "pause") {
            bool changed = timer.pause(request.at("by").get<string>());
            return {{"changed", changed}, {"clock", clock_json(timer.state())}};
        }
        if (kind == "unpause") {
            bool changed = timer.unpause(request.at("by").get<string>());
            return {{"changed", changed}, {"clock", clock_json(timer.state())}};
        }
        if (kind == "check_in") {
            dispatcher.publish(check_in{request.at("name").get<string>(), chrono::system_clock::now()});
            return {{"ok", true}};
        }
        if (kind == "cancel") {
            return {{"cancelled", registry.cancel(request.at("id").get<string>())}};
        }
        if (kind == "status") return status();
        if (kind == "leaderboard") {
            return {{"teams", compute_leaderboard(*records, conf.packet.problems.size())}};
        }
    } catch (json::exception &e) {
        LOG(WARNING) << "Malformed " << (kind.empty() ? "" : kind + " ") << "request: " << e.what();
        return error_response(string("malformed request: ") + e.what());
    }
    return error_response("unknown request kind " + kind);
}

json competition_server::handle_submission(const json &request, bool test_run) {
    submission submit;
    if (request.count("id") && !request.at("id").is_null())
        submit.id = request.at("id").get<string>();
    else
        submit.id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    submit.submitter = request.at("submitter").get<string>();
    submit.problem = request.at("problem").get<size_t>();
    submit.language = request.at("language").get<string>();
    submit.source = request.at("code").get<string>();
    submit.created_at = chrono::system_clock::now();

    auto result = test_run ? judge.run_tests(submit) : judge.submit(submit);
    return submitter_view(result, MAX_COMPILE_ERROR_LENGTH);
}

json competition_server::status() const {
    json live = json::array();
    for (auto &progress : registry.list())
        live.push_back(progress_json(progress));
    return {{"clock", clock_json(timer.state())},
            {"shutting_down", judge.is_shutting_down()},
            {"in_flight", move(live)}};
}

const competition_config &competition_server::config() const {
    return conf;
}

submission_pipeline &competition_server::pipeline() {
    return judge;
}

subscriber_hub &competition_server::hub() {
    return subscribers;
}

competition_clock &competition_server::clock() {
    return timer;
}

submission_store &competition_server::store() {
    return *records;
}

}  // namespace arbiter::server
