#include "judge/judge_service.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace arena {
using namespace std;

judge_service::judge_service(const grader &judge, store::problem_store &problems, store::contest_store &contests,
                             store::contest_result_store &results)
    : judge(judge), problems(problems), contests(contests), results(results) {}

contest judge_service::load_contest(const string &contest_id) {
    auto c = contests.find_contest(contest_id);
    if (!c) throw grading_rejected("Contest not found: " + contest_id);
    return *c;
}

contest_result judge_service::load_or_create(const string &user_id, const contest &c, chrono::system_clock::time_point now) {
    if (auto existing = results.find(user_id, c.id))
        return *existing;

    vector<problem> known;
    for (auto &entry : c.problems)
        if (auto prob = problems.find_problem(entry.problem_id))
            known.push_back(*prob);
    LOG(INFO) << "Creating contest result of user " << user_id << " in contest " << c.id;
    return results.create(create_contest_result(user_id, c, known, now));
}

submit_response judge_service::submit(const submit_request &request, const cancellation_token &token,
                                      chrono::system_clock::time_point now) {
    contest c = load_contest(request.contest_id);
    if (!c.is_running(now))
        throw grading_rejected(fmt::format("Contest {} is not running", c.id));
    if (!c.find_problem(request.problem_id))
        throw grading_rejected(fmt::format("Problem {} is not part of contest {}", request.problem_id, c.id));

    if (auto existing = results.find(request.user_id, c.id); existing && existing->is_completed)
        throw grading_rejected(fmt::format("User {} has already submitted final results of contest {}", request.user_id, c.id));

    auto prob = problems.find_problem(request.problem_id);
    if (!prob) throw grading_rejected("Problem not found: " + request.problem_id);

    submit_response response;
    response.submit = judge.grade(request.code, request.language, *prob, token);
    response.submit.id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    response.submit.user_id = request.user_id;
    response.submit.contest_id = c.id;
    response.submit.submitted_at = now;

    response.standing = record(c, response.submit, token, now);
    return response;
}

contest_result judge_service::record(const contest &c, const submission &submit, const cancellation_token &token,
                                     chrono::system_clock::time_point now) {
    submission_outcome outcome = outcome_of(submit);
    bool is_first_accept = submit.max_score > 0 && submit.score == submit.max_score;

    for (int attempt = 0; attempt <= STORE_MAX_RETRIES; ++attempt) {
        if (token.cancelled()) throw grading_cancelled();

        contest_result previous = load_or_create(submit.user_id, c, now);
        contest_result updated = apply_submission(previous, submit.problem_id, outcome, is_first_accept, now);
        if (results.save(updated)) return updated;

        LOG(WARNING) << "Conflict saving contest result of user " << submit.user_id << " in contest " << c.id
                     << ", retrying (" << attempt + 1 << "/" << STORE_MAX_RETRIES << ")";
    }
    throw store_error(fmt::format("Unable to save contest result of user {} in contest {} after {} retries",
                                  submit.user_id, c.id, STORE_MAX_RETRIES));
}

contest_result judge_service::finish(const string &user_id, const string &contest_id, int penalties,
                                     chrono::system_clock::time_point now) {
    contest c = load_contest(contest_id);
    for (int attempt = 0; attempt <= STORE_MAX_RETRIES; ++attempt) {
        contest_result previous = load_or_create(user_id, c, now);
        contest_result completed = complete_contest(previous, penalties, now);
        if (results.save(completed)) {
            LOG(INFO) << "User " << user_id << " completed contest " << contest_id << " with score " << completed.total_score
                      << " in " << format_duration(completed.total_time_ms);
            return completed;
        }
    }
    throw store_error(fmt::format("Unable to save contest result of user {} in contest {} after {} retries",
                                  user_id, contest_id, STORE_MAX_RETRIES));
}

}  // namespace arena
