#include "server/competition.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <fstream>
#include <limits>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, test_case &test) {
    j.at("input").get_to(test.input);
    j.at("output").get_to(test.output);
    if (j.count("visible"))
        j.at("visible").get_to(test.visible);
    else
        test.visible = false;
    if (j.count("weight"))
        j.at("weight").get_to(test.weight);
    else
        test.weight = 1;
}

/**
 * @brief 读取以 unit 字节为单位的大小，在换算成字节之前检查范围
 * @throw configuration_error 不是正数或者换算后溢出时
 */
static int64_t read_size(const json &j, const char *key, int64_t unit) {
    auto value = j.at(key).get<int64_t>();
    if (value <= 0 || value > numeric_limits<int64_t>::max() / unit)
        throw configuration_error(fmt::format("{} must be a positive size, got {}", key, value));
    return value * unit;
}

void from_json(const json &j, test_runner_config &config) {
    if (j.count("timeout_ms"))
        config.timeout = chrono::milliseconds(j.at("timeout_ms").get<int64_t>());
    if (j.count("trim_output"))
        j.at("trim_output").get_to(config.trim_output);
    if (j.count("max_memory")) {
        auto &memory = j.at("max_memory");
        // 配置中以 MiB 为单位
        if (memory.count("compile"))
            config.compile_memory = read_size(memory, "compile", 1ll << 20);
        if (memory.count("run"))
            config.run_memory = read_size(memory, "run", 1ll << 20);
    }
    // 配置中以 KiB 为单位
    if (j.count("max_file_size"))
        config.max_file_size = read_size(j, "max_file_size", 1ll << 10);
    if (j.count("max_output_bytes"))
        j.at("max_output_bytes").get_to(config.max_output_bytes);
    if (j.count("parallelism"))
        j.at("parallelism").get_to(config.parallelism);
    if (j.count("max_processes"))
        j.at("max_processes").get_to(config.max_processes);
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("strict"))
        j.at("strict").get_to(config.strict);
    if (j.count("restrict_network"))
        j.at("restrict_network").get_to(config.restrict_network);
    if (j.count("restrict_filesystem"))
        j.at("restrict_filesystem").get_to(config.restrict_filesystem);
    if (j.count("cgroup"))
        j.at("cgroup").get_to(config.cgroup);
    if (j.count("read_only_paths")) {
        config.read_only_paths.clear();
        for (auto &path : j.at("read_only_paths"))
            config.read_only_paths.emplace_back(path.get<string>());
    }
}

}  // namespace arbiter

namespace arbiter::server {
using namespace std;
using namespace nlohmann;

bool problem::allows(const string &language) const {
    if (!languages) return true;
    return find(languages->begin(), languages->end(), language) != languages->end();
}

vector<test_case> problem::visible_tests() const {
    vector<test_case> result;
    copy_if(tests.begin(), tests.end(), back_inserter(result), [](const test_case &test) { return test.visible; });
    return result;
}

const language *competition_config::find_language(const string &name) const {
    auto it = languages.find(name);
    return it == languages.end() ? nullptr : &it->second;
}

const problem *competition_config::find_problem(size_t index) const {
    return index < packet.problems.size() ? &packet.problems[index] : nullptr;
}

void from_json(const json &j, problem &prob) {
    j.at("title").get_to(prob.title);
    if (j.count("description"))
        j.at("description").get_to(prob.description);
    if (j.count("languages") && !j.at("languages").is_null())
        prob.languages = j.at("languages").get<vector<string>>();
    else
        prob.languages.reset();
    j.at("tests").get_to(prob.tests);
}

void from_json(const json &j, packet &pkt) {
    j.at("title").get_to(pkt.title);
    if (j.count("preamble"))
        j.at("preamble").get_to(pkt.preamble);
    j.at("problems").get_to(pkt.problems);
}

competition_config parse_competition(const json &j) {
    competition_config config;
    try {
        if (j.count("max_submissions") && !j.at("max_submissions").is_null())
            config.max_submissions = j.at("max_submissions").get<int>();
        if (j.count("duration_minutes") && !j.at("duration_minutes").is_null())
            config.duration = chrono::minutes(j.at("duration_minutes").get<int64_t>());
        if (j.count("test_runner"))
            j.at("test_runner").get_to(config.test_runner);
        if (j.count("sandbox"))
            j.at("sandbox").get_to(config.sandbox);
        for (auto &[name, value] : j.at("languages").items())
            config.languages.emplace(name, parse_language(name, value));
        if (j.count("integrations")) {
            auto &integrations = j.at("integrations");
            if (integrations.count("events"))
                for (auto &hook : integrations.at("events"))
                    config.event_hooks.emplace_back(hook.get<string>());
            if (integrations.count("timeout_ms"))
                config.hook_timeout = chrono::milliseconds(integrations.at("timeout_ms").get<int64_t>());
        }
        j.at("packet").get_to(config.packet);
    } catch (json::exception &e) {
        throw configuration_error(string("malformed competition configuration: ") + e.what());
    }

    validate(config);
    return config;
}

competition_config load_competition(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw configuration_error("unable to open competition configuration " + path.string());

    json j;
    try {
        fin >> j;
    } catch (json::exception &e) {
        throw configuration_error("competition configuration " + path.string() + " is not valid JSON: " + e.what());
    }

    auto config = parse_competition(j);
    LOG(INFO) << fmt::format("Loaded competition \"{}\" with {} problems and {} languages",
                             config.packet.title, config.packet.problems.size(), config.languages.size());
    return config;
}

void validate(const competition_config &config) {
    if (config.max_submissions && *config.max_submissions <= 0)
        throw configuration_error("max_submissions must be positive");
    if (config.duration && config.duration->count() <= 0)
        throw configuration_error("duration_minutes must be positive");

    auto &limits = config.test_runner;
    if (limits.timeout.count() <= 0)
        throw configuration_error("test_runner.timeout_ms must be positive");
    if (limits.compile_memory <= 0 || limits.run_memory <= 0)
        throw configuration_error("test_runner.max_memory must be positive");
    if (limits.max_file_size <= 0)
        throw configuration_error("test_runner.max_file_size must be positive");
    if (limits.max_output_bytes == 0)
        throw configuration_error("test_runner.max_output_bytes must be positive");
    if (limits.parallelism == 0)
        throw configuration_error("test_runner.parallelism must be positive");
    if (config.hook_timeout.count() <= 0)
        throw configuration_error("integrations.timeout_ms must be positive");

    if (config.languages.empty())
        throw configuration_error("no languages are configured");
    if (config.packet.problems.empty())
        throw configuration_error("packet has no problems");

    for (size_t i = 0; i < config.packet.problems.size(); ++i) {
        auto &prob = config.packet.problems[i];
        if (prob.tests.empty())
            throw configuration_error(fmt::format("problem {} ({}) has no tests", i, prob.title));
        for (size_t t = 0; t < prob.tests.size(); ++t)
            if (prob.tests[t].weight <= 0)
                throw configuration_error(fmt::format("test {} of problem {} ({}) must have a positive weight", t, i, prob.title));
        if (prob.languages) {
            if (prob.languages->empty())
                throw configuration_error(fmt::format("problem {} ({}) allows no languages", i, prob.title));
            for (auto &name : *prob.languages)
                if (!config.find_language(name))
                    throw configuration_error(fmt::format("problem {} ({}) allows unknown language {}", i, prob.title, name));
        }
    }
}

}  // namespace arbiter::server
