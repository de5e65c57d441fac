#include "judge/report.hpp"
#include <algorithm>

namespace hjudge {
using namespace std;

submission_report submission_report::from_problem(const problem_info &problem) {
    submission_report report;
    for (auto &subtask : problem.subtasks) {
        subtask_result sr;
        sr.name = subtask.name;
        sr.full_score = subtask.score;
        sr.method = subtask.method;
        for (auto &testcase : subtask.testcases) {
            testcase_result tr;
            tr.input = testcase.input;
            tr.output = testcase.output;
            tr.full_score = testcase.full_score;
            sr.testcases.push_back(tr);
        }
        report.subtasks.push_back(move(sr));
    }
    return report;
}

subtask_result *submission_report::find_subtask(const string &name) {
    for (auto &subtask : subtasks)
        if (subtask.name == name) return &subtask;
    return nullptr;
}

void subtask_result::aggregate() {
    // 因为依赖关系被跳过
    if (result == status::SKIPPED) {
        score = 0;
        return;
    }
    if (testcases.empty()) {
        result = status::ACCEPTED;
        score = method == "min" ? full_score : 0;
        return;
    }

    bool judged = false, all_accepted = true;
    status worst = status::ACCEPTED;
    int64_t sum = 0;
    for (auto &testcase : testcases) {
        if (!is_final(testcase.result)) {
            if (testcase.result == status::SKIPPED) all_accepted = false;
            continue;
        }
        judged = true;
        sum += testcase.score;
        if (testcase.result != status::ACCEPTED) all_accepted = false;
        if (severity(testcase.result) > severity(worst)) worst = testcase.result;
    }
    if (!judged) {
        score = 0;
        return;
    }

    result = worst;
    if (method == "min")
        score = all_accepted ? full_score : 0;
    else
        score = sum;
}

void submission_report::aggregate() {
    status worst = status::ACCEPTED;
    score = 0;
    for (auto &subtask : subtasks) {
        subtask.aggregate();
        score += subtask.score;
        if (is_final(subtask.result) && severity(subtask.result) > severity(worst))
            worst = subtask.result;
        for (auto &testcase : subtask.testcases) {
            time = max(time, testcase.time);
            memory = max(memory, testcase.memory);
        }
    }
    result = worst;
}

}  // namespace hjudge
