#include "contest/contest_result.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include "common/exceptions.hpp"

namespace arena {
using namespace std;

problem_result *contest_result::find(const string &problem_id) {
    for (auto &result : problem_results)
        if (result.problem_id == problem_id) return &result;
    return nullptr;
}

const problem_result *contest_result::find(const string &problem_id) const {
    for (auto &result : problem_results)
        if (result.problem_id == problem_id) return &result;
    return nullptr;
}

void contest_result::calculate_totals() {
    total_score = 0;
    total_time_ms = 0;
    for (auto &result : problem_results) {
        total_score += result.score;
        total_time_ms += result.time_spent_ms;
    }
}

submission_outcome outcome_of(const submission &submit) {
    return {submit.score, submit.max_score, submit.total_execution_time_ms};
}

grade grade_of(int score, int max_score) {
    if (max_score > 0 && score >= max_score) return grade::ACCEPTED;
    if (score > 0) return grade::PARTIAL;
    return grade::ATTEMPTED;
}

contest_result create_contest_result(const string &user_id, const contest &c, const vector<problem> &problems,
                                     chrono::system_clock::time_point now) {
    contest_result result;
    result.user_id = user_id;
    result.contest_id = c.id;
    result.started_at = now;

    vector<contest_problem> entries = c.problems;
    stable_sort(entries.begin(), entries.end(), [](auto &a, auto &b) { return a.order < b.order; });
    for (auto &entry : entries) {
        problem_result pr;
        pr.problem_id = entry.problem_id;
        pr.max_score = max(entry.points, 0);
        for (auto &prob : problems)
            if (prob.id == entry.problem_id) pr.max_score = prob.max_score();
        result.problem_results.push_back(pr);
    }
    result.calculate_totals();
    return result;
}

contest_result apply_submission(contest_result result, const string &problem_id, const submission_outcome &outcome,
                                bool is_first_accept, chrono::system_clock::time_point now) {
    if (result.is_completed)
        throw grading_rejected(fmt::format("Contest result of user {} in contest {} is already completed", result.user_id, result.contest_id));

    problem_result *pr = result.find(problem_id);
    if (!pr) {
        problem_result synthesized;
        synthesized.problem_id = problem_id;
        synthesized.max_score = outcome.max_score;
        result.problem_results.push_back(synthesized);
        pr = &result.problem_results.back();
    }

    pr->score = max(pr->score, outcome.score);
    pr->time_spent_ms += outcome.time_spent_ms;
    pr->submission_count += 1;
    pr->status = max(pr->status, grade_of(outcome.score, outcome.max_score));

    if (pr->status == grade::ACCEPTED && is_first_accept && !pr->first_accepted_at)
        pr->first_accepted_at = now;

    result.calculate_totals();
    return result;
}

contest_result complete_contest(contest_result result, int penalties, chrono::system_clock::time_point now) {
    if (result.is_completed)
        throw grading_rejected(fmt::format("Contest result of user {} in contest {} is already completed", result.user_id, result.contest_id));

    result.penalties = max(penalties, 0);
    result.completed_at = now;
    result.is_completed = true;
    result.calculate_totals();
    return result;
}

void rank_results(vector<contest_result> &results) {
    auto better = [](const contest_result &a, const contest_result &b) {
        if (a.total_score != b.total_score) return a.total_score > b.total_score;
        return a.total_time_ms < b.total_time_ms;
    };
    stable_sort(results.begin(), results.end(), better);

    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0 && !better(results[i - 1], results[i]))
            results[i].rank = results[i - 1].rank;
        else
            results[i].rank = (int)i + 1;
    }
}

static bool is_plain_number(const string &str) {
    if (str.empty() || !isdigit((unsigned char)str.front()) || !isdigit((unsigned char)str.back())) return false;
    return count(str.begin(), str.end(), '.') <= 1 &&
           all_of(str.begin(), str.end(), [](char c) { return isdigit((unsigned char)c) || c == '.'; });
}

long long parse_duration_ms(const string &value) {
    string trimmed = boost::algorithm::trim_copy(value);
    try {
        if (is_plain_number(trimmed)) {
            double num = boost::lexical_cast<double>(trimmed);
            return num > 3600 ? (long long)floor(num) : (long long)floor(num * 1000);
        }

        vector<string> parts;
        boost::algorithm::split(parts, trimmed, boost::is_any_of(":"));
        if (parts.size() == 3) {
            double hh = boost::lexical_cast<double>(parts[0]);
            double mm = boost::lexical_cast<double>(parts[1]);
            double ss = boost::lexical_cast<double>(parts[2]);
            return (long long)((hh * 3600 + mm * 60 + ss) * 1000);
        }
    } catch (boost::bad_lexical_cast &) {
        // 无法解析的时长视为 0
    }
    return 0;
}

string format_duration(long long ms) {
    long long total_seconds = max(0LL, ms / 1000);
    return fmt::format("{:02}:{:02}:{:02}", total_seconds / 3600, total_seconds % 3600 / 60, total_seconds % 60);
}

}  // namespace arena
