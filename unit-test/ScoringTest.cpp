#include "gtest/gtest.h"
#include "judge/scoring.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace arena;

static test_result passed(const string &id) {
    test_result result;
    result.test_case_id = id;
    result.passed = true;
    result.status = status::ACCEPTED;
    return result;
}

static test_result failed(const string &id, status stat = status::WRONG_ANSWER) {
    test_result result;
    result.test_case_id = id;
    result.status = stat;
    return result;
}

TEST(ScoringTest, PartialScore) {
    vector<test_case> cases = {make_test_case("1", "", "", 40), make_test_case("2", "", "", 60)};
    auto outcome = score({failed("1"), passed("2")}, cases, 100);
    EXPECT_EQ(outcome.score, 60);
    EXPECT_EQ(outcome.max_score, 100);
    EXPECT_EQ(outcome.result, verdict(grade::PARTIAL));
    EXPECT_EQ(to_string(outcome.result), "partial");
    EXPECT_EQ(status_of(outcome.result), status::WRONG_ANSWER);
}

TEST(ScoringTest, Accepted) {
    vector<test_case> cases = {make_test_case("1", "", "", 40), make_test_case("2", "", "", 60)};
    auto outcome = score({passed("1"), passed("2")}, cases, 100);
    EXPECT_EQ(outcome.score, 100);
    EXPECT_EQ(outcome.result, verdict(grade::ACCEPTED));
    EXPECT_EQ(status_of(outcome.result), status::ACCEPTED);
}

TEST(ScoringTest, NoTestCasesFallsBackToProblemPoints) {
    auto outcome = score({}, {}, 100);
    EXPECT_EQ(outcome.score, 0);
    EXPECT_EQ(outcome.max_score, 100);
    EXPECT_EQ(outcome.result, verdict(grade::ATTEMPTED));
}

TEST(ScoringTest, ZeroScoreIsAttempted) {
    vector<test_case> cases = {make_test_case("1", "", "", 1)};
    auto outcome = score({failed("1")}, cases, 100);
    EXPECT_EQ(outcome.max_score, 1);
    EXPECT_EQ(outcome.result, verdict(grade::ATTEMPTED));
    EXPECT_FALSE(is_fault(outcome.result));
}

TEST(ScoringTest, ZeroMaxScoreIsNeverAccepted) {
    vector<test_case> cases = {make_test_case("1", "", "", 0)};
    auto outcome = score({passed("1")}, cases, 100);
    EXPECT_EQ(outcome.max_score, 0);
    EXPECT_EQ(outcome.result, verdict(grade::ATTEMPTED));
}

TEST(ScoringTest, LengthMismatchIsLogicError) {
    vector<test_case> cases = {make_test_case("1", "", "", 1), make_test_case("2", "", "", 1)};
    EXPECT_THROW(score({passed("1")}, cases, 100), logic_error);
}

TEST(ScoringTest, FaultsPreemptScore) {
    vector<test_case> cases = {make_test_case("1", "", "", 40), make_test_case("2", "", "", 60)};

    auto tle = score({failed("1", status::TIME_LIMIT_EXCEEDED), passed("2")}, cases, 100);
    EXPECT_EQ(tle.score, 60);
    EXPECT_EQ(tle.result, verdict(fault::TIME_LIMIT_EXCEEDED));
    EXPECT_TRUE(is_fault(tle.result));
    EXPECT_EQ(status_of(tle.result), status::TIME_LIMIT_EXCEEDED);

    auto re = score({failed("1", status::RUNTIME_ERROR), passed("2")}, cases, 100);
    EXPECT_EQ(re.result, verdict(fault::RUNTIME_ERROR));
}

TEST(ScoringTest, FaultPrecedence) {
    vector<test_case> cases = {make_test_case("1", "", ""), make_test_case("2", "", ""), make_test_case("3", "", "")};

    auto outcome = score({failed("1", status::RUNTIME_ERROR), failed("2", status::TIME_LIMIT_EXCEEDED), failed("3", status::COMPILATION_ERROR)}, cases, 100);
    EXPECT_EQ(outcome.result, verdict(fault::COMPILATION_ERROR));

    outcome = score({failed("1", status::RUNTIME_ERROR), failed("2", status::TIME_LIMIT_EXCEEDED), passed("3")}, cases, 100);
    EXPECT_EQ(outcome.result, verdict(fault::TIME_LIMIT_EXCEEDED));
}

TEST(ScoringTest, SystemErrorIsNotAFault) {
    vector<test_case> cases = {make_test_case("1", "", "", 50), make_test_case("2", "", "", 50)};
    auto outcome = score({failed("1", status::SYSTEM_ERROR), passed("2")}, cases, 100);
    EXPECT_EQ(outcome.result, verdict(grade::PARTIAL));
}

TEST(ScoringTest, OutputsMatchTrimsOnlyTheEnds) {
    EXPECT_TRUE(outputs_match("  7  ", "7\n"));
    EXPECT_TRUE(outputs_match("1 2\n3\n", "1 2\n3"));
    EXPECT_FALSE(outputs_match("7 \n8", "7\n"));
    EXPECT_FALSE(outputs_match("1  2", "1 2"));
}

TEST(ScoringTest, VerdictStrings) {
    EXPECT_EQ(parse_verdict("compilation_error"), verdict(fault::COMPILATION_ERROR));
    EXPECT_EQ(parse_verdict("not_attempted"), verdict(grade::NOT_ATTEMPTED));
    EXPECT_EQ(to_string(verdict(fault::TIME_LIMIT_EXCEEDED)), "time_limit_exceeded");
    EXPECT_THROW(parse_grade("bogus"), invalid_argument);
}
