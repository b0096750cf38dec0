#include "judge/runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <system_error>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

artifact::artifact(const language &lang, scratch_directory dir)
    : lang(lang), dir(move(dir)), built(!lang.is_compiled()) {}

language_runner::language_runner(sandbox::sandbox &executor, test_runner_config limits, sandbox_config isolation,
                                 fs::path scratch_root, bool keep_scratch)
    : sb(executor), config(move(limits)), isolation(move(isolation)), scratch_root(move(scratch_root)), keep_scratch(keep_scratch) {}

const test_runner_config &language_runner::limits() const {
    return config;
}

sandbox::resource_limits language_runner::make_limits(int64_t memory, bool enforce_output) const {
    sandbox::resource_limits limits;
    limits.wall_timeout = config.timeout;
    limits.cpu_timeout = config.timeout;
    limits.memory_limit = memory;
    limits.output_limit = config.max_output_bytes;
    limits.enforce_output_limit = enforce_output;
    limits.file_size_limit = config.max_file_size;
    limits.proc_limit = config.max_processes;
    limits.restrict_network = isolation.restrict_network;
    limits.restrict_filesystem = isolation.restrict_filesystem;
    limits.read_only_paths = isolation.read_only_paths;
    return limits;
}

unique_ptr<artifact> language_runner::materialize(const language &lang, const string &source) const {
    scratch_directory dir(scratch_root, keep_scratch);
    fs::path source_path = dir.path() / lang.source_file;
    try {
        write_file_content(source_path, source);
    } catch (system_error &e) {
        throw sandbox_error(fmt::format("unable to write source file {}: {}", source_path.string(), e.what()));
    }
    return make_unique<artifact>(lang, move(dir));
}

compile_outcome language_runner::build(artifact &program, const sandbox::cancellation_token *cancel) const {
    compile_outcome outcome;
    auto command = program.lang.build_command();
    if (!command) {
        // 解释型语言没有编译步骤
        outcome.success = true;
        outcome.exit_code = 0;
        program.built = true;
        return outcome;
    }

    sandbox::execution_request request;
    request.command = *command;
    request.work_dir = program.dir.path();
    // 限制文件系统时只有工作目录可写，编译器的临时文件也要放在这里
    request.env["TMPDIR"] = program.dir.path().string();
    // 编译器的输出只截断，不会因为输出太多而判定编译失败
    request.limits = make_limits(config.compile_memory, false);

    auto report = sb.run(request, cancel);
    if (!report.spawned)
        throw sandbox_error(fmt::format("unable to start compiler for {}: {}", program.lang.name, report.spawn_error));

    outcome.out = move(report.out.data);
    outcome.err = move(report.err.data);
    outcome.exit_code = report.exit_code;
    outcome.elapsed = report.wall_time;
    outcome.violation = report.violation;
    outcome.success = report.succeeded();
    program.built = outcome.success;
    return outcome;
}

sandbox::execution_report language_runner::execute(const artifact &program, const string &stdin_data,
                                                   const sandbox::cancellation_token *cancel) const {
    if (!program.built)
        throw sandbox_error("program of language " + program.lang.name + " has not been built");

    sandbox::execution_request request;
    request.command = program.lang.run_command();
    request.work_dir = program.dir.path();
    request.stdin_data = stdin_data;
    request.limits = make_limits(config.run_memory, true);
    return sb.run(request, cancel);
}

}  // namespace arbiter
