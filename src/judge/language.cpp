#include "judge/language.hpp"
#include <glog/logging.h>
#include <boost/program_options/parsers.hpp>
#include <boost/token_functions.hpp>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

const string SOURCE_FILE_PLACEHOLDER = "{source_file}";

struct language_preset {
    optional<string> build;
    string run;
    string source_file;
};

// clang-format off
static const map<string, language_preset> presets = {
    {"python3", {nullopt, "python3 {source_file}", "solution.py"}},
    {"java", {"javac {source_file}", "java Solution", "Solution.java"}},
    {"cpp", {"g++ -O2 -std=c++17 -o solution {source_file}", "./solution", "solution.cpp"}},
    {"c", {"gcc -O2 -std=c11 -o solution {source_file} -lm", "./solution", "solution.c"}},
};
// clang-format on

bool language::is_compiled() const {
    return holds_alternative<compiled_language>(kind);
}

optional<vector<string>> language::build_command() const {
    if (auto compiled = get_if<compiled_language>(&kind))
        return expand_command(compiled->build, source_file);
    return nullopt;
}

vector<string> language::run_command() const {
    return visit([this](auto &&lang) { return expand_command(lang.run, source_file); }, kind);
}

vector<string> expand_command(const string &command_template, const string &source_file) {
    vector<string> args;
    try {
        args = boost::program_options::split_unix(replace_all(command_template, SOURCE_FILE_PLACEHOLDER, source_file));
    } catch (boost::escaped_list_error &e) {
        throw configuration_error("malformed command \"" + command_template + "\": " + e.what());
    }
    if (args.empty()) throw configuration_error("command is empty");
    return args;
}

static language make_language(const string &name, const optional<string> &build, const string &run, const string &source_file) {
    language lang;
    lang.name = name;
    try {
        lang.source_file = assert_safe_filename(source_file);
    } catch (invalid_argument &e) {
        throw configuration_error("language " + name + ": " + e.what());
    }
    if (build)
        lang.kind = compiled_language{*build, run};
    else
        lang.kind = interpreted_language{run};

    // 命令模板在加载时就展开一次，保证格式错误不会留到评测时才发现
    try {
        lang.build_command();
        lang.run_command();
    } catch (configuration_error &e) {
        throw configuration_error("language " + name + ": " + e.what());
    }
    return lang;
}

language preset_language(const string &name, const string &version) {
    auto it = presets.find(name);
    if (it == presets.end())
        throw configuration_error("unknown language preset " + name);
    DLOG(INFO) << "Using preset for language " << name << " (version " << version << ")";
    auto &preset = it->second;
    return make_language(name, preset.build, preset.run, preset.source_file);
}

language parse_language(const string &name, const json &config) {
    if (config.is_string())
        return preset_language(name, config.get<string>());
    if (!config.is_object())
        throw configuration_error("language " + name + " must be a preset version or an object");

    try {
        optional<string> build;
        if (config.count("build")) build = config.at("build").get<string>();
        string run = config.at("run").get<string>();
        string source_file = config.at("source_file").get<string>();
        return make_language(name, build, run, source_file);
    } catch (json::exception &e) {
        throw configuration_error("language " + name + ": " + e.what());
    }
}

}  // namespace arbiter
