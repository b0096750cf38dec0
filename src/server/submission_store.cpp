#include "server/submission_store.hpp"
#include <glog/logging.h>
#include <set>
#include <system_error>
#include "common/exceptions.hpp"
#include "judge/scoring.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

// clang-format off
NLOHMANN_JSON_SERIALIZE_ENUM(test_result_kind, {
    {test_result_kind::PASS, "pass"},
    {test_result_kind::FAIL, "fail"},
    {test_result_kind::TIMEOUT, "timeout"},
    {test_result_kind::RUNTIME_ERROR, "runtime_error"},
    {test_result_kind::RESOURCE_EXCEEDED, "resource_exceeded"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(submission_state, {
    {submission_state::QUEUED, "queued"},
    {submission_state::COMPILING, "compiling"},
    {submission_state::COMPILE_FAILED, "compile_failed"},
    {submission_state::RUNNING, "running"},
    {submission_state::COMPLETED, "completed"},
    {submission_state::CANCELLED, "cancelled"},
    {submission_state::FAILED, "failed"},
    {submission_state::REJECTED, "rejected"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(limit_violation, {
    {limit_violation::NONE, nullptr},
    {limit_violation::WALL_TIME, "wall_time"},
    {limit_violation::CPU_TIME, "cpu_time"},
    {limit_violation::MEMORY, "memory"},
    {limit_violation::OUTPUT, "output"},
})
// clang-format on

void to_json(json &j, const compile_outcome &outcome) {
    j = {{"success", outcome.success},
         {"stdout", outcome.out},
         {"stderr", outcome.err},
         {"exit_status", outcome.exit_code},
         {"time_taken", outcome.elapsed.count()},
         {"violation", outcome.violation}};
}

void from_json(const json &j, compile_outcome &outcome) {
    j.at("success").get_to(outcome.success);
    j.at("stdout").get_to(outcome.out);
    j.at("stderr").get_to(outcome.err);
    j.at("exit_status").get_to(outcome.exit_code);
    outcome.elapsed = chrono::milliseconds(j.at("time_taken").get<int64_t>());
    if (j.count("violation"))
        j.at("violation").get_to(outcome.violation);
}

void to_json(json &j, const test_outcome &outcome) {
    j = {{"index", outcome.index},
         {"result", outcome.kind},
         {"stdout", outcome.out},
         {"stderr", outcome.err},
         {"exit_status", outcome.exit_code},
         {"time_taken", outcome.elapsed.count()},
         {"visible", outcome.visible},
         {"weight", outcome.weight}};
}

void from_json(const json &j, test_outcome &outcome) {
    j.at("index").get_to(outcome.index);
    j.at("result").get_to(outcome.kind);
    j.at("stdout").get_to(outcome.out);
    j.at("stderr").get_to(outcome.err);
    j.at("exit_status").get_to(outcome.exit_code);
    outcome.elapsed = chrono::milliseconds(j.at("time_taken").get<int64_t>());
    j.at("visible").get_to(outcome.visible);
    j.at("weight").get_to(outcome.weight);
}

}  // namespace arbiter

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission_record &record) {
    j = {{"id", record.id},
         {"submitter", record.submitter},
         {"problem", record.problem},
         {"language", record.language},
         {"code", record.source},
         {"created_at", chrono::duration_cast<chrono::milliseconds>(record.created_at.time_since_epoch()).count()},
         {"state", record.state},
         {"tests", record.tests},
         {"score", record.score},
         {"success", record.success},
         {"time_taken", record.elapsed.count()},
         {"failure_reason", record.failure_reason}};
    if (record.compile)
        j["compile"] = *record.compile;
    else
        j["compile"] = nullptr;
}

void from_json(const json &j, submission_record &record) {
    j.at("id").get_to(record.id);
    j.at("submitter").get_to(record.submitter);
    j.at("problem").get_to(record.problem);
    j.at("language").get_to(record.language);
    j.at("code").get_to(record.source);
    record.created_at = chrono::system_clock::time_point(chrono::milliseconds(j.at("created_at").get<int64_t>()));
    j.at("state").get_to(record.state);
    j.at("tests").get_to(record.tests);
    j.at("score").get_to(record.score);
    j.at("success").get_to(record.success);
    record.elapsed = chrono::milliseconds(j.at("time_taken").get<int64_t>());
    j.at("failure_reason").get_to(record.failure_reason);
    if (j.count("compile") && !j.at("compile").is_null())
        record.compile = j.at("compile").get<compile_outcome>();
    else
        record.compile.reset();
}

submission_store::~submission_store() = default;

const submission_record &memory_submission_store::find_running(const string &id) const {
    auto it = records.find(id);
    if (it == records.end())
        throw internal_error("submission " + id + " has no pending record");
    if (is_terminal(it->second.state))
        throw internal_error("submission " + id + " has already been finalized");
    return it->second;
}

void memory_submission_store::persist(const string &, const json &) {}

void memory_submission_store::apply(const string &op, const json &payload) {
    if (op == "pending" || op == "update") {
        replace(payload.get<submission_record>());
    } else if (op == "test_run") {
        ++test_runs[{payload.at("submitter").get<string>(), payload.at("problem").get<size_t>()}];
    } else {
        throw internal_error("unknown history operation " + op);
    }
}

void memory_submission_store::commit(const string &op, submission_record record) {
    // 先写入历史，写入失败时内存中的记录保持不变
    persist(op, record);
    replace(move(record));
}

void memory_submission_store::replace(submission_record record) {
    auto it = records.find(record.id);
    if (it == records.end()) {
        order.push_back(record.id);
        records.emplace(record.id, move(record));
    } else {
        it->second = move(record);
    }
}

void memory_submission_store::create_pending(const submission &submit, const optional<compile_outcome> &compile) {
    scoped_lock lock(mut);
    if (records.count(submit.id))
        throw internal_error("submission " + submit.id + " already has a record");

    submission_record record;
    record.id = submit.id;
    record.submitter = submit.submitter;
    record.problem = submit.problem;
    record.language = submit.language;
    record.source = submit.source;
    record.created_at = submit.created_at;
    record.state = submission_state::RUNNING;
    record.compile = compile;
    commit("pending", move(record));
}

void memory_submission_store::finalize(const submission_result &result) {
    scoped_lock lock(mut);
    submission_record record = find_running(result.submission_id);
    record.state = result.state;
    record.compile = result.compile;
    record.tests = result.tests;
    record.score = to_percentage(result.score());
    record.success = result.success();
    record.elapsed = result.elapsed;
    commit("update", move(record));
}

void memory_submission_store::mark_failed(const string &id, const string &reason) {
    scoped_lock lock(mut);
    submission_record record = find_running(id);
    record.state = submission_state::FAILED;
    record.failure_reason = reason;
    commit("update", move(record));
}

void memory_submission_store::mark_cancelled(const string &id) {
    scoped_lock lock(mut);
    submission_record record = find_running(id);
    record.state = submission_state::CANCELLED;
    commit("update", move(record));
}

int memory_submission_store::count_attempts(const string &submitter, size_t problem) const {
    scoped_lock lock(mut);
    int count = 0;
    // 只计入有评测结果的提交。调用方持有准入登记，此时同一选手同一题目上停留在 RUNNING 的记录
    // 只可能来自写入失败或者服务异常退出，同样没有结果
    for (auto &[id, record] : records)
        if (record.submitter == submitter && record.problem == problem &&
            (record.state == submission_state::COMPLETED || record.state == submission_state::COMPILE_FAILED))
            ++count;
    return count;
}

void memory_submission_store::record_test_run(const string &submitter, size_t problem) {
    scoped_lock lock(mut);
    persist("test_run", {{"submitter", submitter}, {"problem", problem}});
    ++test_runs[{submitter, problem}];
}

int memory_submission_store::count_test_runs(const string &submitter, size_t problem) const {
    scoped_lock lock(mut);
    auto it = test_runs.find({submitter, problem});
    return it == test_runs.end() ? 0 : it->second;
}

optional<submission_record> memory_submission_store::find(const string &id) const {
    scoped_lock lock(mut);
    auto it = records.find(id);
    if (it == records.end()) return nullopt;
    return it->second;
}

vector<submission_record> memory_submission_store::latest_results(const string &submitter) const {
    scoped_lock lock(mut);
    map<size_t, const submission_record *> latest;
    for (auto &id : order) {
        auto &record = records.at(id);
        if (record.submitter == submitter &&
            (record.state == submission_state::COMPLETED || record.state == submission_state::COMPILE_FAILED))
            latest[record.problem] = &record;
    }

    vector<submission_record> results;
    for (auto &[problem, record] : latest) results.push_back(*record);
    return results;
}

vector<string> memory_submission_store::submitters() const {
    scoped_lock lock(mut);
    set<string> names;
    for (auto &[id, record] : records) names.insert(record.submitter);
    for (auto &[key, count] : test_runs) names.insert(key.first);
    return vector<string>(names.begin(), names.end());
}

jsonl_submission_store::jsonl_submission_store(const filesystem::path &path) : path(path) {
    {
        scoped_lock lock(mut);
        ifstream fin(path);
        string line;
        size_t lineno = 0;
        while (getline(fin, line)) {
            ++lineno;
            if (line.empty()) continue;
            try {
                json entry = json::parse(line);
                apply(entry.at("op").get<string>(), entry.at("payload"));
            } catch (json::exception &e) {
                throw internal_error("malformed history file " + path.string() + " at line " + to_string(lineno) + ": " + e.what());
            }
        }
        LOG(INFO) << "Replayed " << lineno << " history entries from " << path;
    }

    fout.open(path, ios::app);
    if (!fout) throw system_error(errno, system_category(), "unable to open history file " + path.string());
}

void jsonl_submission_store::persist(const string &op, const json &payload) {
    json entry = {{"op", op}, {"payload", payload}};
    fout << entry.dump() << '\n';
    fout.flush();
    if (!fout) throw system_error(errno, system_category(), "unable to write history file " + path.string());
}

}  // namespace arbiter::server
