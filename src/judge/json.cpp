#include "judge/json.hpp"
#include <boost/algorithm/string/replace.hpp>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

long long to_epoch_ms(chrono::system_clock::time_point time) {
    return chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
}

chrono::system_clock::time_point from_epoch_ms(long long ms) {
    return chrono::system_clock::time_point(chrono::duration_cast<chrono::system_clock::duration>(chrono::milliseconds(ms)));
}

/**
 * @brief 测试数据可能以数组、对象等形式存储，统一转为文本
 */
static string as_text(const json &j) {
    if (j.is_null()) return "";
    if (j.is_string()) return j.get<string>();
    return j.dump();
}

/**
 * @brief 还原代码模板中转义的换行符和制表符，只用于展示给选手的初始代码
 * 评测框架参与编译，其中字符串字面量里的 \\n 必须原样保留
 */
static string unescape_code(string code) {
    boost::algorithm::replace_all(code, "\\n", "\n");
    boost::algorithm::replace_all(code, "\\t", "\t");
    return code;
}

void from_json(const json &j, test_case &value) {
    assign_optional(j, value.id, "id");
    value.input = as_text(access_optional(j, "input"));
    value.expected_output = as_text(access_optional(j, "expected_output"));
    assign_optional(j, value.is_hidden, "is_hidden");
    assign_optional(j, value.points, "points");
    if (value.points < 0)
        throw invalid_argument("Test case " + value.id + " has negative points");
}

void to_json(json &j, const test_case &value) {
    j = {{"id", value.id},
         {"input", value.input},
         {"expected_output", value.expected_output},
         {"is_hidden", value.is_hidden},
         {"points", value.points}};
}

void from_json(const json &j, problem &value) {
    value.id = get_value<string>(j, "id");
    assign_optional(j, value.title, "title");
    assign_optional(j, value.time_limit_ms, "time_limit_ms");
    assign_optional(j, value.memory_limit_mb, "memory_limit_mb");
    assign_optional(j, value.points, "points");

    value.test_cases.clear();
    if (exists(j, "test_cases")) {
        for (auto &elem : j.at("test_cases")) {
            test_case testcase = elem.get<test_case>();
            if (testcase.id.empty()) testcase.id = std::to_string(value.test_cases.size());
            value.test_cases.push_back(testcase);
        }
    }

    value.code_templates.clear();
    if (exists(j, "code_templates"))
        for (auto &[language, code] : j.at("code_templates").items())
            value.code_templates[language] = unescape_code(code.get<string>());

    json harness = access_optional(j, "harness");
    if (harness.is_object()) {
        map<string, string> harnesses;
        for (auto &[language, code] : harness.items())
            harnesses[language] = code.get<string>();
        value.harness = harnesses;
    } else if (harness.is_string()) {
        value.harness = harness.get<string>();
    } else if (harness.is_null()) {
        value.harness = string();
    } else {
        throw build_invalid_argument(j, "harness");
    }
}

void to_json(json &j, const problem &value) {
    j = {{"id", value.id},
         {"title", value.title},
         {"time_limit_ms", value.time_limit_ms},
         {"memory_limit_mb", value.memory_limit_mb},
         {"points", value.points},
         {"test_cases", value.test_cases},
         {"code_templates", value.code_templates}};
    visit([&](auto &harness) { j["harness"] = harness; }, value.harness);
}

void to_json(json &j, const test_result &value) {
    j = {{"test_case_id", value.test_case_id},
         {"passed", value.passed},
         {"status", get_display_message(value.status)},
         {"execution_time_ms", value.execution_time_ms},
         {"memory_used_mb", value.memory_used_mb},
         {"memory_estimated", value.memory_estimated},
         {"output", utf8_sanitize(value.output)},
         {"error", utf8_sanitize(value.error)}};
}

static status parse_status(const string &str) {
    for (int i = (int)status::PENDING; i <= (int)status::SYSTEM_ERROR; ++i)
        if (str == get_display_message((status)i)) return (status)i;
    throw invalid_argument("Unrecognized status " + str);
}

void from_json(const json &j, test_result &value) {
    value.test_case_id = get_value<string>(j, "test_case_id");
    assign_optional(j, value.passed, "passed");
    if (exists(j, "status")) value.status = parse_status(get_value<string>(j, "status"));
    assign_optional(j, value.execution_time_ms, "execution_time_ms");
    assign_optional(j, value.memory_used_mb, "memory_used_mb");
    assign_optional(j, value.memory_estimated, "memory_estimated");
    assign_optional(j, value.output, "output");
    assign_optional(j, value.error, "error");
}

void to_json(json &j, const submission &value) {
    j = {{"id", value.id},
         {"user_id", value.user_id},
         {"contest_id", value.contest_id},
         {"problem_id", value.problem_id},
         {"language", value.language},
         {"code", utf8_sanitize(value.code)},
         {"test_results", value.test_results},
         {"score", value.score},
         {"max_score", value.max_score},
         {"total_execution_time_ms", value.total_execution_time_ms},
         {"total_memory_used_mb", value.total_memory_used_mb},
         {"memory_estimated", value.memory_estimated},
         {"status", get_display_message(value.status)},
         {"result", to_string(value.result)},
         {"submitted_at", to_epoch_ms(value.submitted_at)}};
    if (value.evaluated_at) j["evaluated_at"] = to_epoch_ms(*value.evaluated_at);
}

void from_json(const json &j, submission &value) {
    assign_optional(j, value.id, "id");
    assign_optional(j, value.user_id, "user_id");
    assign_optional(j, value.contest_id, "contest_id");
    value.problem_id = get_value<string>(j, "problem_id");
    value.language = get_value<string>(j, "language");
    value.code = get_value<string>(j, "code");
    assign_optional(j, value.test_results, "test_results");
    assign_optional(j, value.score, "score");
    assign_optional(j, value.max_score, "max_score");
    assign_optional(j, value.total_execution_time_ms, "total_execution_time_ms");
    assign_optional(j, value.total_memory_used_mb, "total_memory_used_mb");
    assign_optional(j, value.memory_estimated, "memory_estimated");
    if (exists(j, "status")) value.status = parse_status(get_value<string>(j, "status"));
    if (exists(j, "result")) value.result = parse_verdict(get_value<string>(j, "result"));
    if (exists(j, "submitted_at")) value.submitted_at = from_epoch_ms(get_value<long long>(j, "submitted_at"));
    if (exists(j, "evaluated_at")) value.evaluated_at = from_epoch_ms(get_value<long long>(j, "evaluated_at"));
}

}  // namespace arena
