#include "judge/problem.hpp"
#include "config.hpp"

namespace arena {
using namespace std;

int sum_points(const vector<test_case> &test_cases, int fallback_points) {
    if (test_cases.empty()) return fallback_points;
    int total = 0;
    for (auto &testcase : test_cases)
        total += max(testcase.points, 0);
    return total;
}

int problem::max_score() const {
    return sum_points(test_cases, points);
}

int problem::effective_time_limit_ms() const {
    return time_limit_ms > 0 ? time_limit_ms : DEFAULT_TIME_LIMIT_MS;
}

int problem::effective_memory_limit_mb() const {
    return memory_limit_mb > 0 ? memory_limit_mb : DEFAULT_MEMORY_LIMIT_MB;
}

}  // namespace arena
