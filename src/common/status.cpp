#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace arena {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "pending")
    (status::RUNNING, "running")
    (status::ACCEPTED, "accepted")
    (status::WRONG_ANSWER, "wrong_answer")
    (status::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::COMPILATION_ERROR, "compilation_error")
    (status::SYSTEM_ERROR, "system_error");

static const unordered_map<grade, const char *> grade_string = boost::assign::map_list_of
    (grade::NOT_ATTEMPTED, "not_attempted")
    (grade::ATTEMPTED, "attempted")
    (grade::PARTIAL, "partial")
    (grade::ACCEPTED, "accepted");

static const unordered_map<fault, const char *> fault_string = boost::assign::map_list_of
    (fault::COMPILATION_ERROR, "compilation_error")
    (fault::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (fault::RUNTIME_ERROR, "runtime_error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *to_string(grade g) {
    return grade_string.at(g);
}

const char *to_string(fault f) {
    return fault_string.at(f);
}

string to_string(const verdict &v) {
    return visit([](auto value) { return string(to_string(value)); }, v);
}

grade parse_grade(const string &str) {
    for (auto &[key, value] : grade_string)
        if (str == value) return key;
    throw invalid_argument("Unrecognized grade " + str);
}

verdict parse_verdict(const string &str) {
    for (auto &[key, value] : fault_string)
        if (str == value) return key;
    return parse_grade(str);
}

bool is_fault(const verdict &v) {
    return holds_alternative<fault>(v);
}

status status_of(const verdict &v) {
    if (auto f = get_if<fault>(&v)) {
        switch (*f) {
            case fault::COMPILATION_ERROR:
                return status::COMPILATION_ERROR;
            case fault::TIME_LIMIT_EXCEEDED:
                return status::TIME_LIMIT_EXCEEDED;
            case fault::RUNTIME_ERROR:
                return status::RUNTIME_ERROR;
        }
    }
    switch (get<grade>(v)) {
        case grade::ACCEPTED:
            return status::ACCEPTED;
        case grade::NOT_ATTEMPTED:
            return status::PENDING;
        default:
            return status::WRONG_ANSWER;
    }
}

}  // namespace arena
