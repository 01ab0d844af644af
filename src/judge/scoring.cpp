#include "judge/scoring.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string/trim.hpp>
#include <optional>
#include <stdexcept>

namespace arena {
using namespace std;

static optional<fault> fault_of(status stat) {
    switch (stat) {
        case status::COMPILATION_ERROR:
            return fault::COMPILATION_ERROR;
        case status::TIME_LIMIT_EXCEEDED:
            return fault::TIME_LIMIT_EXCEEDED;
        case status::RUNTIME_ERROR:
            return fault::RUNTIME_ERROR;
        default:
            return nullopt;
    }
}

score_result score(const vector<test_result> &results, const vector<test_case> &test_cases, int fallback_points) {
    if (results.size() != test_cases.size())
        throw logic_error(fmt::format("{} test results for {} test cases", results.size(), test_cases.size()));

    score_result outcome;
    outcome.max_score = sum_points(test_cases, fallback_points);

    optional<fault> worst;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].passed) outcome.score += max(test_cases[i].points, 0);

        // fault 的枚举值越小优先级越高
        if (auto f = fault_of(results[i].status))
            if (!worst || *f < *worst) worst = f;
    }

    if (worst) {
        outcome.result = *worst;
    } else if (outcome.max_score > 0 && outcome.score == outcome.max_score) {
        outcome.result = grade::ACCEPTED;
    } else if (outcome.score > 0) {
        outcome.result = grade::PARTIAL;
    } else {
        outcome.result = grade::ATTEMPTED;
    }
    return outcome;
}

bool outputs_match(const string &output, const string &expected_output) {
    return boost::algorithm::trim_copy(output) == boost::algorithm::trim_copy(expected_output);
}

}  // namespace arena
