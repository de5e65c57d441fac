#include "gtest/gtest.h"
#include "judge/report.hpp"

using namespace std;
using namespace hjudge;

static testcase_result make_testcase(status result, int64_t score, int64_t full_score = 10) {
    testcase_result testcase;
    testcase.result = result;
    testcase.score = score;
    testcase.full_score = full_score;
    return testcase;
}

TEST(ReportTest, SumMethodAddsScores) {
    subtask_result subtask;
    subtask.full_score = 30;
    subtask.method = "sum";
    subtask.testcases = {make_testcase(status::ACCEPTED, 10), make_testcase(status::WRONG_ANSWER, 0), make_testcase(status::ACCEPTED, 10)};
    subtask.aggregate();
    EXPECT_EQ(subtask.result, status::WRONG_ANSWER);
    EXPECT_EQ(subtask.score, 20);
}

TEST(ReportTest, MinMethodIsAllOrNothing) {
    subtask_result subtask;
    subtask.full_score = 40;
    subtask.method = "min";
    subtask.testcases = {make_testcase(status::ACCEPTED, 10), make_testcase(status::ACCEPTED, 10)};
    subtask.aggregate();
    EXPECT_EQ(subtask.result, status::ACCEPTED);
    EXPECT_EQ(subtask.score, 40);

    subtask.testcases = {make_testcase(status::TIME_LIMIT_EXCEEDED, 0), make_testcase(status::SKIPPED, 0)};
    subtask.aggregate();
    EXPECT_EQ(subtask.result, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(subtask.score, 0);
}

TEST(ReportTest, WorstVerdictWins) {
    subtask_result subtask;
    subtask.testcases = {make_testcase(status::WRONG_ANSWER, 0), make_testcase(status::SYSTEM_ERROR, 0), make_testcase(status::ACCEPTED, 10)};
    subtask.aggregate();
    EXPECT_EQ(subtask.result, status::SYSTEM_ERROR);
}

TEST(ReportTest, SkippedSubtaskScoresZero) {
    subtask_result subtask;
    subtask.full_score = 50;
    subtask.method = "min";
    subtask.result = status::SKIPPED;
    subtask.testcases = {make_testcase(status::SKIPPED, 0)};
    subtask.aggregate();
    EXPECT_EQ(subtask.result, status::SKIPPED);
    EXPECT_EQ(subtask.score, 0);
}

TEST(ReportTest, SubmissionAggregatesSubtasks) {
    submission_report report;
    subtask_result a, b;
    a.name = "a";
    a.testcases = {make_testcase(status::ACCEPTED, 10)};
    a.testcases[0].time = 120;
    a.testcases[0].memory = 4 << 20;
    b.name = "b";
    b.testcases = {make_testcase(status::RUNTIME_ERROR, 0)};
    b.testcases[0].time = 30;
    b.testcases[0].memory = 8 << 20;
    report.subtasks = {a, b};
    report.aggregate();
    EXPECT_EQ(report.result, status::RUNTIME_ERROR);
    EXPECT_EQ(report.score, 10);
    EXPECT_EQ(report.time, 120);
    EXPECT_EQ(report.memory, 8 << 20);
    EXPECT_NE(report.find_subtask("b"), nullptr);
    EXPECT_EQ(report.find_subtask("c"), nullptr);
}

TEST(ReportTest, ReportFromProblem) {
    problem_info problem;
    subtask_info subtask;
    subtask.name = "sub1";
    subtask.score = 100;
    subtask.method = "min";
    subtask.testcases = {{"1.in", "1.out", 50}, {"2.in", "2.out", 50}};
    problem.subtasks = {subtask};

    auto report = submission_report::from_problem(problem);
    ASSERT_EQ(report.subtasks.size(), 1u);
    EXPECT_EQ(report.subtasks[0].full_score, 100);
    EXPECT_EQ(report.subtasks[0].method, "min");
    ASSERT_EQ(report.subtasks[0].testcases.size(), 2u);
    EXPECT_EQ(report.subtasks[0].testcases[1].input, "2.in");
    EXPECT_EQ(report.subtasks[0].testcases[1].result, status::WAITING);
}
