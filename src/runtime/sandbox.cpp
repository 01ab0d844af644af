#include "runtime/sandbox.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <cstring>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runtime/process.hpp"

namespace arena {
using namespace std;
namespace fs = std::filesystem;

resource_policy::~resource_policy() {}

bool resource_policy::apply(const run_limits &) const {
    return true;
}

optional<double> resource_policy::measure(const struct rusage &) const {
    return nullopt;
}

bool rlimit_policy::apply(const run_limits &limits) const {
    if (limits.memory_limit_mb <= 0) return true;
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = (rlim_t)limits.memory_limit_mb << 20;
    return setrlimit(RLIMIT_AS, &lim) == 0;
}

optional<double> rlimit_policy::measure(const struct rusage &usage) const {
    // Linux 下 ru_maxrss 的单位为 KB
    return usage.ru_maxrss / 1024.0;
}

sandbox::~sandbox() {}

/**
 * @brief 没有真实测量值时，按照程序标准输出的大小估算内存使用量
 */
static double estimate_memory_mb(const string &output) {
    return output.size() / (1024.0 * 1024.0);
}

static void compile(const language_runtime &language, const artifact_set &artifacts, const cancellation_token &token, raw_result &result) {
    process_options options;
    options.argv = language.compile_command(artifacts);
    options.cwd = artifacts.dir;
    options.time_limit_ms = COMPILE_TIME_LIMIT_MS;
    options.max_output_bytes = MAX_OUTPUT_BYTES;
    options.token = token;
    DLOG(INFO) << "Compiling " << language.name() << ": " << boost::algorithm::join(options.argv, " ");

    process_result compiler = run_process(options);
    if (compiler.cancelled) {
        result.cancelled = true;
        return;
    }

    string log = compiler.stderr_text + compiler.stdout_text;
    if (compiler.timed_out)
        throw compilation_error(fmt::format("Compilation timed out after {} ms", COMPILE_TIME_LIMIT_MS), log);
    if (compiler.exit_code != 0)
        throw compilation_error(fmt::format("Compilation failed with exit code {}", compiler.exit_code), log);
}

local_sandbox::local_sandbox(const fs::path &run_dir, shared_ptr<resource_policy> policy)
    : run_dir(run_dir), policy(move(policy)) {}

raw_result local_sandbox::run(const string &source, const language_runtime &language, const string &input,
                              const run_limits &limits, const cancellation_token &token) {
    raw_result result;
    if (token.cancelled()) {
        result.cancelled = true;
        result.error = "Grading cancelled";
        return result;
    }

    unique_ptr<scoped_directory> workdir;
    try {
        workdir = make_unique<scoped_directory>(run_dir);
    } catch (fs::filesystem_error &e) {
        throw internal_error(fmt::format("Unable to create artifact directory under {}: {}", run_dir, e.what()));
    }
    defer {
        if (DEBUG) {
            LOG(INFO) << "Keeping artifact directory " << workdir->path();
            workdir->keep();
        }
    };

    artifact_set artifacts;
    try {
        artifacts = language.materialize(workdir->path(), source);
    } catch (system_error &e) {
        throw internal_error(fmt::format("Unable to write source file: {}", e.what()));
    }

    if (language.needs_compilation()) {
        try {
            compile(language, artifacts, token, result);
        } catch (compilation_error &e) {
            LOG(INFO) << "Compilation failed for " << language.name() << ": " << e.what();
            result.compile_failed = true;
            result.compile_output = e.error_log;
            result.error = e.error_log.empty() ? e.what() : string(e.what()) + "\n" + e.error_log;
            return result;
        }
        if (result.cancelled) {
            result.error = "Grading cancelled";
            return result;
        }
    }

    process_options options;
    options.argv = language.run_command(artifacts);
    options.cwd = artifacts.dir;
    options.stdin_text = input;
    options.time_limit_ms = limits.time_limit_ms;
    options.max_output_bytes = MAX_OUTPUT_BYTES;
    options.token = token;
    auto current_policy = policy;
    options.before_exec = [current_policy, limits] { return current_policy->apply(limits); };
    DLOG(INFO) << "Running " << language.name() << ": " << boost::algorithm::join(options.argv, " ");

    process_result process = run_process(options);

    result.stdout_text = move(process.stdout_text);
    result.stderr_text = move(process.stderr_text);
    result.exit_code = process.exit_code;
    result.timed_out = process.timed_out;
    result.cancelled = process.cancelled;
    result.wall_time_ms = process.wall_time_ms;

    if (auto measured = policy->measure(process.usage)) {
        result.memory_used_mb = *measured;
        result.memory_estimated = false;
    } else {
        result.memory_used_mb = estimate_memory_mb(result.stdout_text);
        result.memory_estimated = true;
    }

    if (result.timed_out) {
        result.error = fmt::format("Time limit exceeded: killed after {} ms", limits.time_limit_ms);
    } else if (result.cancelled) {
        result.error = "Grading cancelled";
    } else if (process.signal) {
        result.error = fmt::format("Process terminated by signal {} ({}): {}", process.signal, strsignal(process.signal), result.stderr_text);
    } else if (result.exit_code != 0) {
        result.error = fmt::format("Process exited with code {}: {}", result.exit_code, result.stderr_text);
    }
    return result;
}

}  // namespace arena
