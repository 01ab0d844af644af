#include "judge/grader.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <optional>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/harness.hpp"
#include "judge/scoring.hpp"

namespace arena {
using namespace std;

grader::grader(const language_registry &languages, sandbox &box)
    : languages(languages), box(box) {}

test_result make_test_result(const test_case &testcase, const raw_result &raw) {
    test_result result;
    result.test_case_id = testcase.id;
    result.execution_time_ms = raw.wall_time_ms;
    result.memory_used_mb = raw.memory_used_mb;
    result.memory_estimated = raw.memory_estimated;
    result.output = raw.stdout_text;
    result.error = raw.error.empty() ? raw.stderr_text : raw.error;

    if (raw.compile_failed) {
        result.status = status::COMPILATION_ERROR;
        result.execution_time_ms = 0;
        result.memory_used_mb = 0;
    } else if (raw.timed_out) {
        result.status = status::TIME_LIMIT_EXCEEDED;
    } else if (raw.exit_code != 0) {
        result.status = status::RUNTIME_ERROR;
    } else {
        result.passed = outputs_match(raw.stdout_text, testcase.expected_output);
        result.status = result.passed ? status::ACCEPTED : status::WRONG_ANSWER;
    }
    return result;
}

static test_result make_system_error(const test_case &testcase, const string &message) {
    test_result result;
    result.test_case_id = testcase.id;
    result.status = status::SYSTEM_ERROR;
    result.error = message;
    return result;
}

submission grader::grade(const string &code, const string &language, const problem &prob, const cancellation_token &token) const {
    const language_runtime &runtime = languages.at(language);

    run_limits limits{prob.effective_time_limit_ms(), prob.effective_memory_limit_mb()};
    // 每个测试点都在独立的目录中重新编译，编译时间同样计入
    long long per_test_ms = limits.time_limit_ms + (runtime.needs_compilation() ? COMPILE_TIME_LIMIT_MS : 0);
    long long worst_case_ms = (long long)prob.test_cases.size() * per_test_ms;
    if (worst_case_ms > MAX_GRADING_TIME_MS)
        throw grading_rejected(fmt::format("Problem {} needs up to {} ms to grade ({} test cases x {} ms), exceeding the limit of {} ms",
                                           prob.id, worst_case_ms, prob.test_cases.size(), per_test_ms, MAX_GRADING_TIME_MS));

    if (token.cancelled()) throw grading_cancelled();

    submission submit;
    submit.problem_id = prob.id;
    submit.language = language;
    submit.code = code;
    submit.submitted_at = chrono::system_clock::now();
    submit.status = status::RUNNING;

    string source = compose_harness(code, runtime, prob);

    optional<test_result> compile_failure;
    for (auto &testcase : prob.test_cases) {
        if (compile_failure) {
            // 编译失败的代码再次编译也不会成功，剩余测试点直接复用编译错误
            test_result result = *compile_failure;
            result.test_case_id = testcase.id;
            submit.test_results.push_back(move(result));
            continue;
        }

        raw_result raw;
        try {
            raw = box.run(source, runtime, testcase.input, limits, token);
        } catch (exception &ex) {
            LOG(ERROR) << "Unable to run test case " << testcase.id << " of problem " << prob.id << ": " << ex.what();
            submit.test_results.push_back(make_system_error(testcase, ex.what()));
            continue;
        }

        if (raw.cancelled) throw grading_cancelled();

        test_result result = make_test_result(testcase, raw);
        if (raw.compile_failed) compile_failure = result;
        submit.test_results.push_back(move(result));
    }

    for (auto &result : submit.test_results) {
        submit.total_execution_time_ms += result.execution_time_ms;
        submit.total_memory_used_mb += result.memory_used_mb;
        if (result.status != status::COMPILATION_ERROR && result.status != status::SYSTEM_ERROR)
            submit.memory_estimated |= result.memory_estimated;
    }

    score_result outcome = score(submit.test_results, prob.test_cases, prob.points);
    submit.score = outcome.score;
    submit.max_score = outcome.max_score;
    submit.result = outcome.result;
    submit.status = status_of(outcome.result);
    submit.evaluated_at = chrono::system_clock::now();

    LOG(INFO) << submit << " graded: " << to_string(submit.result) << " " << submit.score << "/" << submit.max_score;
    return submit;
}

}  // namespace arena
