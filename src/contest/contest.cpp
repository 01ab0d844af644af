#include "contest/contest.hpp"

namespace arena {
using namespace std;

chrono::system_clock::time_point contest::end_time() const {
    return start_time + chrono::milliseconds(duration_ms);
}

bool contest::is_running(chrono::system_clock::time_point now) const {
    return start_time <= now && now <= end_time();
}

bool contest::has_ended(chrono::system_clock::time_point now) const {
    return now > end_time();
}

const contest_problem *contest::find_problem(const string &problem_id) const {
    for (auto &entry : problems)
        if (entry.problem_id == problem_id) return &entry;
    return nullptr;
}

}  // namespace arena
