#include "contest/json.hpp"
#include "common/json_utils.hpp"
#include "judge/json.hpp"

namespace arena {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, contest &value) {
    value.id = get_value<string>(j, "id");
    assign_optional(j, value.title, "title");
    value.start_time = from_epoch_ms(get_value<long long>(j, "start_time"));
    assign_optional(j, value.duration_ms, "duration_ms");

    value.problems.clear();
    if (exists(j, "problems")) {
        for (auto &elem : j.at("problems")) {
            contest_problem entry;
            entry.problem_id = get_value<string>(elem, "problem_id");
            assign_optional(elem, entry.order, "order");
            assign_optional(elem, entry.points, "points");
            value.problems.push_back(entry);
        }
    }
}

void to_json(json &j, const contest &value) {
    json problems = json::array();
    for (auto &entry : value.problems)
        problems.push_back({{"problem_id", entry.problem_id}, {"order", entry.order}, {"points", entry.points}});
    j = {{"id", value.id},
         {"title", value.title},
         {"start_time", to_epoch_ms(value.start_time)},
         {"duration_ms", value.duration_ms},
         {"end_time", to_epoch_ms(value.end_time())},
         {"problems", problems}};
}

void from_json(const json &j, problem_result &value) {
    value.problem_id = get_value<string>(j, "problem_id");
    assign_optional(j, value.score, "score");
    assign_optional(j, value.max_score, "max_score");
    assign_optional(j, value.time_spent_ms, "time_spent_ms");
    assign_optional(j, value.submission_count, "submission_count");
    if (exists(j, "first_accepted_at")) value.first_accepted_at = from_epoch_ms(get_value<long long>(j, "first_accepted_at"));
    if (exists(j, "status")) value.status = parse_grade(get_value<string>(j, "status"));
}

void to_json(json &j, const problem_result &value) {
    j = {{"problem_id", value.problem_id},
         {"score", value.score},
         {"max_score", value.max_score},
         {"time_spent_ms", value.time_spent_ms},
         {"submission_count", value.submission_count},
         {"status", to_string(value.status)}};
    if (value.first_accepted_at) j["first_accepted_at"] = to_epoch_ms(*value.first_accepted_at);
}

void from_json(const json &j, contest_result &value) {
    value.user_id = get_value<string>(j, "user_id");
    value.contest_id = get_value<string>(j, "contest_id");
    assign_optional(j, value.problem_results, "problem_results");
    assign_optional(j, value.penalties, "penalties");
    if (exists(j, "rank")) value.rank = get_value<int>(j, "rank");
    if (exists(j, "started_at")) value.started_at = from_epoch_ms(get_value<long long>(j, "started_at"));
    if (exists(j, "completed_at")) value.completed_at = from_epoch_ms(get_value<long long>(j, "completed_at"));
    assign_optional(j, value.is_completed, "is_completed");
    assign_optional(j, value.version, "version");
    // 总分和总用时总是由题目成绩推导
    value.calculate_totals();
}

void to_json(json &j, const contest_result &value) {
    j = {{"user_id", value.user_id},
         {"contest_id", value.contest_id},
         {"problem_results", value.problem_results},
         {"total_score", value.total_score},
         {"total_time_ms", value.total_time_ms},
         {"total_time", format_duration(value.total_time_ms)},
         {"penalties", value.penalties},
         {"started_at", to_epoch_ms(value.started_at)},
         {"is_completed", value.is_completed},
         {"version", value.version}};
    if (value.rank) j["rank"] = *value.rank;
    if (value.completed_at) j["completed_at"] = to_epoch_ms(*value.completed_at);
}

}  // namespace arena
