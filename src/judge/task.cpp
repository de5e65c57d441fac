#include "judge/task.hpp"
#include <boost/algorithm/string/replace.hpp>
#include "common/json_utils.hpp"

namespace hjudge {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, testcase_info &testcase) {
    testcase.input = get_value<string>(j, "input");
    testcase.output = get_value<string>(j, "output");
    testcase.full_score = get_value_def<int64_t>(j, 0, "full_score");
}

void from_json(const json &j, subtask_info &subtask) {
    subtask.name = get_value<string>(j, "name");
    subtask.score = get_value_def<int64_t>(j, 0, "score");
    subtask.method = get_value_def<string>(j, "sum", "method");
    if (subtask.method != "sum" && subtask.method != "min")
        throw invalid_argument("Unknown scoring method of subtask " + subtask.name + ": " + subtask.method);
    subtask.time_limit = get_value<int64_t>(j, "time_limit");
    subtask.memory_limit = get_value<int64_t>(j, "memory_limit");
    subtask.testcases = get_value_def<vector<testcase_info>>(j, {}, "testcases");
}

void from_json(const json &j, problem_info &problem) {
    problem.id = get_value<int64_t>(j, "id");
    problem.spj_filename = get_value_def<string>(j, "", "spj_filename");
    // 评测网站用 0/1 表示
    const json *file_io = detail_path::locate(j, "using_file_io");
    problem.using_file_io = file_io && (file_io->is_boolean() ? file_io->get<bool>() : get_value_def<int>(j, 0, "using_file_io") != 0);
    problem.input_file_name = get_value_def<string>(j, "", "input_file_name");
    problem.output_file_name = get_value_def<string>(j, "", "output_file_name");
    problem.provides = get_value_def<vector<string>>(j, {}, "provides");
    problem.subtasks = get_value_def<vector<subtask_info>>(j, {}, "subtasks");
}

void from_json(const json &j, language_config &lang) {
    lang.id = get_value_def<string>(j, "", "id");
    lang.source_file = get_value<string>(j, "source_file");
    lang.output_file = get_value<string>(j, "output_file");
    lang.compile = get_value<string>(j, "compile");
    lang.run = get_value<string>(j, "run");
}

string language_config::source_name(const string &filename) const {
    return boost::algorithm::replace_all_copy(source_file, "{filename}", filename);
}

string language_config::output_name(const string &filename) const {
    return boost::algorithm::replace_all_copy(output_file, "{filename}", filename);
}

string language_config::compile_command(const string &filename, const string &extra) const {
    string command = compile;
    boost::algorithm::replace_all(command, "{source}", source_name(filename));
    boost::algorithm::replace_all(command, "{output}", output_name(filename));
    boost::algorithm::replace_all(command, "{extra}", extra);
    boost::algorithm::replace_all(command, "{filename}", filename);
    return command;
}

string language_config::run_command(const string &program, const string &redirect) const {
    string command = run;
    boost::algorithm::replace_all(command, "{program}", program);
    boost::algorithm::replace_all(command, "{redirect}", redirect);
    return command;
}

struct mode_name_visitor {
    const char *operator()(const traditional_mode &) const { return "traditional"; }
    const char *operator()(const special_judge_mode &) const { return "special_judge"; }
    const char *operator()(const submit_answer_mode &) const { return "submit_answer"; }
    const char *operator()(const interactive_ide_mode &) const { return "ide"; }
};

const char *mode_name(const judge_mode &mode) {
    return visit(mode_name_visitor(), mode);
}

}  // namespace hjudge
