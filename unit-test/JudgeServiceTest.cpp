#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/judge_service.hpp"
#include "test/environment.hpp"
#include "test/mock_sandbox.hpp"
#include "worker.hpp"

using namespace std;
using namespace arena;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

/**
 * @brief 第一次保存之前插入另一个提交的合并，模拟并发写入冲突
 */
struct conflicting_store : public store::contest_result_store {
    explicit conflicting_store(store::memory_contest_result_store &inner, int conflicts)
        : inner(inner), conflicts(conflicts) {}

    optional<contest_result> find(const string &user_id, const string &contest_id) override {
        return inner.find(user_id, contest_id);
    }

    contest_result create(const contest_result &initial) override {
        return inner.create(initial);
    }

    bool save(contest_result &result) override {
        if (conflicts > 0) {
            --conflicts;
            auto current = *inner.find(result.user_id, result.contest_id);
            auto other = apply_submission(current, "two-sum", {10, 100, 1}, false, chrono::system_clock::now());
            EXPECT_TRUE(inner.save(other));
        }
        return inner.save(result);
    }

    store::memory_contest_result_store &inner;
    int conflicts;
};

class JudgeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        problem prob;
        prob.id = "two-sum";
        prob.time_limit_ms = 1000;
        prob.test_cases = {make_test_case("1", "1 2\n", "3", 50), make_test_case("2", "3 4\n", "7", 50)};
        problems.put(prob);

        prob = problem();
        prob.id = "off-contest";
        problems.put(prob);

        contest c;
        c.id = "weekly-1";
        c.start_time = now - chrono::minutes(10);
        c.duration_ms = 3600000;
        c.problems = {{"two-sum", 0, 100}, {"not-loaded", 1, 30}};
        contests.put(c);

        ON_CALL(box, run(_, _, "1 2\n", _, _)).WillByDefault(Return(mock::finished("3", 10)));
        ON_CALL(box, run(_, _, "3 4\n", _, _)).WillByDefault(Return(mock::finished("7", 20)));
    }

    submit_request request(const string &user = "alice", const string &problem_id = "two-sum") {
        return submit_request{user, "weekly-1", problem_id, "python", "print(3)"};
    }

    chrono::system_clock::time_point now = chrono::system_clock::now();
    NiceMock<mock::mock_sandbox> box;
    grader judge{test_languages(), box};
    store::memory_problem_store problems;
    store::memory_contest_store contests;
    store::memory_contest_result_store results;
    judge_service service{judge, problems, contests, results};
};

TEST_F(JudgeServiceTest, SubmitGradesAndRecords) {
    auto response = service.submit(request(), cancellation_token(), now);
    EXPECT_FALSE(response.submit.id.empty());
    EXPECT_EQ(response.submit.user_id, "alice");
    EXPECT_EQ(response.submit.contest_id, "weekly-1");
    EXPECT_EQ(response.submit.score, 100);
    EXPECT_EQ(response.submit.status, status::ACCEPTED);

    auto &standing = response.standing;
    ASSERT_EQ(standing.problem_results.size(), 2u);
    EXPECT_EQ(standing.problem_results[1].problem_id, "not-loaded");
    EXPECT_EQ(standing.problem_results[1].max_score, 30);

    auto *pr = standing.find("two-sum");
    ASSERT_NE(pr, nullptr);
    EXPECT_EQ(pr->score, 100);
    EXPECT_EQ(pr->status, grade::ACCEPTED);
    EXPECT_EQ(pr->time_spent_ms, 30);
    ASSERT_TRUE(pr->first_accepted_at);
    EXPECT_EQ(*pr->first_accepted_at, now);
    EXPECT_EQ(standing.total_score, 100);

    auto stored = results.find("alice", "weekly-1");
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->total_score, 100);
    EXPECT_EQ(stored->version, 1);
}

TEST_F(JudgeServiceTest, RejectsOutsideContestWindow) {
    EXPECT_CALL(box, run(_, _, _, _, _)).Times(0);
    EXPECT_THROW(service.submit(request(), cancellation_token(), now - chrono::hours(1)), grading_rejected);
    EXPECT_THROW(service.submit(request(), cancellation_token(), now + chrono::hours(2)), grading_rejected);
    EXPECT_FALSE(results.find("alice", "weekly-1"));
}

TEST_F(JudgeServiceTest, RejectsUnknownContestAndProblem) {
    EXPECT_CALL(box, run(_, _, _, _, _)).Times(0);

    auto unknown_contest = request();
    unknown_contest.contest_id = "weekly-2";
    EXPECT_THROW(service.submit(unknown_contest, cancellation_token(), now), grading_rejected);
    EXPECT_THROW(service.submit(request("alice", "off-contest"), cancellation_token(), now), grading_rejected);
    EXPECT_THROW(service.submit(request("alice", "not-loaded"), cancellation_token(), now), grading_rejected);
}

TEST_F(JudgeServiceTest, UnsupportedLanguage) {
    auto req = request();
    req.language = "cobol";
    EXPECT_THROW(service.submit(req, cancellation_token(), now), unsupported_language);
    EXPECT_FALSE(results.find("alice", "weekly-1"));
}

TEST_F(JudgeServiceTest, WrongAnswerKeepsBestScore) {
    service.submit(request(), cancellation_token(), now);

    EXPECT_CALL(box, run(_, _, "1 2\n", _, _)).WillOnce(Return(mock::finished("0", 5)));
    auto response = service.submit(request(), cancellation_token(), now + chrono::minutes(1));
    EXPECT_EQ(response.submit.score, 50);

    auto *pr = response.standing.find("two-sum");
    EXPECT_EQ(pr->score, 100);
    EXPECT_EQ(pr->status, grade::ACCEPTED);
    EXPECT_EQ(pr->submission_count, 2);
    EXPECT_EQ(pr->time_spent_ms, 30 + 25);
    EXPECT_EQ(*pr->first_accepted_at, now);
}

TEST_F(JudgeServiceTest, ConcurrentSubmissionsAreSerialized) {
    const int threads = 8;
    vector<thread> submitters;
    atomic<int> failures{0};
    for (int i = 0; i < threads; ++i)
        submitters.emplace_back([&] {
            try {
                service.submit(request(), cancellation_token(), now);
            } catch (judge_exception &ex) {
                ++failures;
                ADD_FAILURE() << ex.what();
            }
        });
    for (auto &submitter : submitters) submitter.join();

    EXPECT_EQ(failures.load(), 0);
    auto stored = results.find("alice", "weekly-1");
    ASSERT_TRUE(stored);
    auto *pr = stored->find("two-sum");
    EXPECT_EQ(pr->submission_count, threads);
    EXPECT_EQ(pr->time_spent_ms, 30 * threads);
    EXPECT_EQ(stored->total_time_ms, 30 * threads);
    EXPECT_EQ(stored->version, threads);
}

TEST_F(JudgeServiceTest, RetriesOnConflict) {
    conflicting_store conflicts(results, 1);
    judge_service conflicted(judge, problems, contests, conflicts);

    auto response = conflicted.submit(request(), cancellation_token(), now);
    auto *pr = response.standing.find("two-sum");
    EXPECT_EQ(pr->submission_count, 2);
    EXPECT_EQ(pr->score, 100);
    EXPECT_EQ(pr->time_spent_ms, 31);
    EXPECT_EQ(results.find("alice", "weekly-1")->version, 2);
}

TEST_F(JudgeServiceTest, GivesUpAfterTooManyConflicts) {
    conflicting_store conflicts(results, STORE_MAX_RETRIES + 1);
    judge_service conflicted(judge, problems, contests, conflicts);
    EXPECT_THROW(conflicted.submit(request(), cancellation_token(), now), store_error);
}

TEST_F(JudgeServiceTest, FinishRejectsLaterSubmissions) {
    service.submit(request(), cancellation_token(), now);
    auto completed = service.finish("alice", "weekly-1", 2, now);
    EXPECT_TRUE(completed.is_completed);
    EXPECT_EQ(completed.penalties, 2);
    EXPECT_EQ(completed.total_score, 100);

    EXPECT_CALL(box, run(_, _, _, _, _)).Times(0);
    EXPECT_THROW(service.submit(request(), cancellation_token(), now), grading_rejected);
    EXPECT_THROW(service.finish("alice", "weekly-1", 0, now), grading_rejected);
}

TEST_F(JudgeServiceTest, FinishWithoutSubmissions) {
    auto completed = service.finish("bob", "weekly-1", 0, now);
    EXPECT_TRUE(completed.is_completed);
    EXPECT_EQ(completed.total_score, 0);
    EXPECT_EQ(completed.problem_results.size(), 2u);
}

TEST_F(JudgeServiceTest, CancelledSubmissionIsNotRecorded) {
    cancellation_token token;
    token.cancel();
    EXPECT_THROW(service.submit(request(), token, now), grading_cancelled);
    EXPECT_FALSE(results.find("alice", "weekly-1"));
}

TEST_F(JudgeServiceTest, Leaderboard) {
    service.submit(request("alice"), cancellation_token(), now);

    EXPECT_CALL(box, run(_, _, "1 2\n", _, _)).WillOnce(Return(mock::finished("0", 10)));
    service.submit(request("bob"), cancellation_token(), now);
    service.finish("carol", "weekly-1", 0, now);

    auto board = results.list("weekly-1");
    ASSERT_EQ(board.size(), 3u);
    rank_results(board);
    EXPECT_EQ(board[0].user_id, "alice");
    EXPECT_EQ(*board[0].rank, 1);
    EXPECT_EQ(board[1].user_id, "bob");
    EXPECT_EQ(board[1].total_score, 50);
    EXPECT_EQ(board[2].user_id, "carol");
    EXPECT_EQ(*board[2].rank, 3);
    EXPECT_TRUE(results.list("weekly-2").empty());
}

TEST_F(JudgeServiceTest, WorkerPool) {
    worker_pool pool(service, 4);

    vector<future<submit_response>> futures;
    for (int i = 0; i < 6; ++i)
        futures.push_back(pool.enqueue(request(i % 2 ? "alice" : "bob")));

    auto bad = request();
    bad.language = "cobol";
    auto rejected = pool.enqueue(bad);

    for (auto &future : futures)
        EXPECT_EQ(future.get().submit.score, 100);
    EXPECT_THROW(rejected.get(), unsupported_language);

    pool.stop();
    EXPECT_THROW(pool.enqueue(request()), grading_rejected);

    EXPECT_EQ(results.find("alice", "weekly-1")->find("two-sum")->submission_count, 3);
    EXPECT_EQ(results.find("bob", "weekly-1")->find("two-sum")->submission_count, 3);
}

TEST_F(JudgeServiceTest, WorkerPoolCancelledBeforeStart) {
    worker_pool pool(service, 1);
    cancellation_token token;
    token.cancel();
    auto cancelled = pool.enqueue(request(), token);
    EXPECT_THROW(cancelled.get(), grading_cancelled);
}
