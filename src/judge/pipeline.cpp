#include "judge/pipeline.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include <unordered_map>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/dependency.hpp"
#include "monitor/monitor.hpp"

namespace hjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;
using sandbox::execution_limits;
using sandbox::execution_result;
using sandbox::scoped_sandbox;
using sandbox::termination_cause;

// clang-format off
static const unordered_map<pipeline_state, const char *> state_string = boost::assign::map_list_of
    (pipeline_state::PENDING, "Pending")
    (pipeline_state::COMPILING, "Compiling")
    (pipeline_state::RUNNING, "Running")
    (pipeline_state::CHECKING, "Checking")
    (pipeline_state::AGGREGATING, "Aggregating")
    (pipeline_state::DONE, "Done")
    (pipeline_state::ERRORED, "Errored");
// clang-format on

const char *get_display_message(pipeline_state state) {
    return state_string.at(state);
}

/**
 * @brief 按照评测模式执行评测
 */
struct mode_dispatcher {
    judge_pipeline &p;

    void operator()(const traditional_mode &) const {
        scoped_sandbox box(p.runner, p.runner.acquire("task-" + p.t.id, p.cpuset));
        simple_line_comparator cmp;
        p.judge_program(cmp, *box);
    }

    void operator()(const special_judge_mode &mode) const {
        scoped_sandbox box(p.runner, p.runner.acquire("task-" + p.t.id, p.cpuset));
        if (!p.compile(*box, p.t.options.extra_compile_parameter, p.t.options.compile_time_limit, p.t.options.compile_result_length_limit))
            return;
        scoped_sandbox checker_box(p.runner, p.runner.acquire("checker-" + p.t.id, p.cpuset));
        auto cmp = p.prepare_checker(*checker_box, mode.checker_language);
        p.judge_program(cmp, *box);
    }

    void operator()(const submit_answer_mode &mode) const {
        scoped_sandbox checker_box(p.runner, p.runner.acquire("checker-" + p.t.id, p.cpuset));
        auto cmp = p.prepare_checker(*checker_box, mode.checker_language);
        p.judge_answers(cmp);
    }

    void operator()(const interactive_ide_mode &) const {
        scoped_sandbox box(p.runner, p.runner.acquire("ide-" + p.t.id, p.cpuset));
        p.run_ide(*box);
    }
};

judge_pipeline::judge_pipeline(const task &t, const judger_config &config, server::platform &platform, sandbox::sandbox_runner &runner, const string &cpuset)
    : t(t), config(config), platform(platform), runner(runner), cpuset(cpuset) {}

submission_report judge_pipeline::run() noexcept {
    try {
        transition(pipeline_state::PENDING);
        prepare();
        LOG(INFO) << "Judging task " << t.id << " in " << mode_name(current_mode) << " mode";
        visit(mode_dispatcher{*this}, current_mode);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Task " << t.id << " failed when " << get_display_message(state()) << ": " << ex.what();
        call_monitor([&](monitor &m) { m.report_error(-1, ex.what()); });
        transition(pipeline_state::ERRORED);
        for (auto &subtask : report.subtasks)
            for (auto &testcase : subtask.testcases)
                if (testcase.result == status::JUDGING) testcase.result = status::WAITING;
        report.result = status::SYSTEM_ERROR;
        report.message = ex.what();
    }
    data_lock.release();
    return report;
}

pipeline_state judge_pipeline::state() const {
    return states.empty() ? pipeline_state::PENDING : states.back();
}

const vector<pipeline_state> &judge_pipeline::history() const {
    return states;
}

const judge_mode &judge_pipeline::mode() const {
    return current_mode;
}

void judge_pipeline::transition(pipeline_state next) {
    VLOG(1) << "Task " << t.id << ": " << get_display_message(next);
    states.push_back(next);
}

void judge_pipeline::progress(const string &message) {
    platform.send_progress(t, report, message);
}

void judge_pipeline::prepare() {
    if (t.kind == task_kind::IDE_RUN) {
        current_mode = interactive_ide_mode{t.input};
        lang = platform.get_language_config(t.language);
        return;
    }

    problem = platform.get_problem_info(t.problem_id);
    problem_dir = config.data_dir / to_string(problem.id);
    report = submission_report::from_problem(problem);

    if (t.options.auto_sync_files) {
        progress("Synchronizing testdata..");
        platform.sync_problem_files(problem.id, problem_dir);
    }
    data_lock = lock_directory(problem_dir, true);

    if (t.options.submit_answer) {
        if (problem.spj_filename.empty())
            BOOST_THROW_EXCEPTION(internal_error("Special judge must be used when using submit-answer problems!"));
        current_mode = submit_answer_mode{problem.spj_filename, special_judge_language(problem.spj_filename)};
    } else {
        if (problem.spj_filename.empty())
            current_mode = traditional_mode{};
        else
            current_mode = special_judge_mode{problem.spj_filename, special_judge_language(problem.spj_filename)};
        lang = platform.get_language_config(t.language);
    }

    fs::path dependency_file = problem_dir / dependency_graph::DEFINITION_FILENAME;
    if (fs::exists(dependency_file)) {
        try {
            dependency = json::parse(read_file_content(dependency_file));
        } catch (json::exception &ex) {
            BOOST_THROW_EXCEPTION(internal_error() << "Malformed " << dependency_graph::DEFINITION_FILENAME << ": " << ex.what());
        }
    }
}

execution_limits judge_pipeline::program_limits(double time_limit, int64_t memory_limit) const {
    execution_limits limits;
    limits.cpu_time = time_limit;
    limits.wall_time = config.wall_time_factor * time_limit + 1;
    limits.memory = memory_limit;
    return limits;
}

bool judge_pipeline::compile(sandbox::sandbox &box, const string &extra, int64_t time_limit, int64_t result_length_limit, int64_t memory_limit) {
    transition(pipeline_state::COMPILING);
    progress("Compiling your program..");

    box.put_file(lang.source_name(DEFAULT_PROGRAM_FILENAME), t.code, true);
    for (auto &file : problem.provides)
        box.copy_file(problem_dir / assert_safe_path(file), file, true);

    execution_limits limits = program_limits(time_limit / 1000.0, memory_limit);
    limits.capture = max<int64_t>(result_length_limit, 0);
    string command = lang.compile_command(DEFAULT_PROGRAM_FILENAME, extra);
    VLOG(1) << "Compiling task " << t.id << ": " << command;
    execution_result result = runner.run(box, command, limits);
    if (result.cause == termination_cause::SANDBOX_INTERNAL_ERROR)
        BOOST_THROW_EXCEPTION(sandbox_error() << "unable to compile user program: " << result.error);

    string output_name = lang.output_name(DEFAULT_PROGRAM_FILENAME);
    if (result.cause != termination_cause::NORMAL_EXIT || !box.exists(output_name)) {
        string output = truncate_text(result.stdout_text + result.stderr_text, max<int64_t>(result_length_limit, 0));
        report.subtasks.clear();
        report.result = status::COMPILE_ERROR;
        report.time = static_cast<int64_t>(ceil(result.time * 1000));
        report.memory = result.memory;
        report.exit_code = result.exit_code;
        report.message = fmt::format("{}{}\nTime usage: {} ms\nMemory usage: {} bytes\nExit code: {}",
                                     output,
                                     result.cause == termination_cause::RUNTIME_ERROR || result.cause == termination_cause::NORMAL_EXIT ? "" : string("\n") + sandbox::get_display_message(result.cause),
                                     report.time, result.memory, result.exit_code);
        LOG(INFO) << "Task " << t.id << " failed to compile";
        transition(pipeline_state::DONE);
        return false;
    }

    box.keep(output_name);
    progress("Compile successfully");
    return true;
}

special_judge_comparator judge_pipeline::prepare_checker(sandbox::sandbox &checker_box, const string &checker_language) {
    language_config checker_lang = platform.get_language_config(checker_language);
    execution_limits limits = program_limits(t.options.spj_execute_time_limit / 1000.0, CHECKER_MEMORY_LIMIT);
    limits.capture = 4096;
    special_judge_comparator cmp(runner, checker_box, checker_lang, limits);
    cmp.compile(problem_dir / assert_safe_path(problem.spj_filename));
    return cmp;
}

void judge_pipeline::judge_subtasks(const function<void(const subtask_info &, const testcase_info &, testcase_result &)> &judge_testcase) {
    vector<string> names;
    for (auto &subtask : problem.subtasks) names.push_back(subtask.name);
    dependency_graph graph(names, dependency);

    while (auto name = graph.next()) {
        const subtask_info *info = nullptr;
        for (auto &subtask : problem.subtasks)
            if (subtask.name == *name) info = &subtask;
        subtask_result &result = *report.find_subtask(*name);

        bool skip_rest = false;
        for (size_t i = 0; i < info->testcases.size(); ++i) {
            testcase_result &testcase = result.testcases[i];
            if (skip_rest) {
                testcase.result = status::SKIPPED;
                continue;
            }

            testcase.result = status::JUDGING;
            progress(fmt::format("Judging subtask {}, testcase {}..", *name, i + 1));
            judge_testcase(*info, info->testcases[i], testcase);
            VLOG(1) << "Task " << t.id << ", subtask " << *name << ", testcase " << i + 1 << ": " << get_display_message(testcase.result);

            if (testcase.result != status::ACCEPTED && info->method == "min")
                skip_rest = true;
        }

        result.aggregate();
        graph.report(result.result == status::ACCEPTED);
    }

    for (auto &[name, reason] : graph.skipped()) {
        subtask_result &result = *report.find_subtask(name);
        result.result = status::SKIPPED;
        for (auto &testcase : result.testcases) {
            testcase.result = status::SKIPPED;
            testcase.message = reason;
        }
    }

    transition(pipeline_state::AGGREGATING);
    report.aggregate();
    transition(pipeline_state::DONE);
}

void judge_pipeline::judge_program(comparator &cmp, sandbox::sandbox &box) {
    // Special Judge 模式在创建 Special Judge 的沙箱前已经编译完成
    if (!holds_alternative<special_judge_mode>(current_mode) &&
        !compile(box, t.options.extra_compile_parameter, t.options.compile_time_limit, t.options.compile_result_length_limit))
        return;

    judge_subtasks([&](const subtask_info &subtask, const testcase_info &testcase, testcase_result &result) {
        run_testcase(box, cmp, subtask, testcase, result);
    });
}

static void apply_compare_result(const compare_result &res, testcase_result &result) {
    result.score = res.score;
    result.message = res.message;
    result.result = res.accepted ? status::ACCEPTED : status::WRONG_ANSWER;
}

void judge_pipeline::run_testcase(sandbox::sandbox &box, comparator &cmp, const subtask_info &subtask, const testcase_info &testcase, testcase_result &result) {
    transition(pipeline_state::RUNNING);
    box.reset();

    string input_name = problem.using_file_io ? problem.input_file_name : "in";
    string output_name = problem.using_file_io ? problem.output_file_name : "out";
    fs::path input_path = problem_dir / assert_safe_path(testcase.input);
    box.copy_file(input_path, input_name);

    double time_scale = t.options.time_scale > 0 ? t.options.time_scale : 1.0;
    execution_limits limits = program_limits(subtask.time_limit * time_scale / 1000.0, subtask.memory_limit << 20);
    limits.output = t.options.output_file_size_limit;
    limits.output_files = {output_name};
    limits.capture = 4096;

    string redirect = problem.using_file_io ? "" : fmt::format("< {} > {}", input_name, output_name);
    string command = lang.run_command(lang.output_name(DEFAULT_PROGRAM_FILENAME), redirect);
    execution_result run = runner.run(box, command, limits);

    result.time = static_cast<int64_t>(ceil(run.time * 1000));
    result.memory = run.memory;
    result.score = 0;
    switch (run.cause) {
        case termination_cause::SANDBOX_INTERNAL_ERROR:
            BOOST_THROW_EXCEPTION(sandbox_error() << "unable to run user program: " << run.error);
        case termination_cause::TIME_LIMIT_EXCEEDED:
            result.result = status::TIME_LIMIT_EXCEEDED;
            return;
        case termination_cause::MEMORY_LIMIT_EXCEEDED:
            result.result = status::MEMORY_LIMIT_EXCEEDED;
            return;
        case termination_cause::OUTPUT_LIMIT_EXCEEDED:
            result.result = status::OUTPUT_LIMIT_EXCEEDED;
            result.message = "Output is too large";
            return;
        case termination_cause::RUNTIME_ERROR:
            result.result = status::RUNTIME_ERROR;
            result.message = fmt::format("Exit code: {}", run.exit_code);
            return;
        case termination_cause::NORMAL_EXIT:
            break;
    }

    transition(pipeline_state::CHECKING);
    string user_out = box.exists(output_name) ? box.read_file(output_name) : "";
    string answer = read_file_content(problem_dir / assert_safe_path(testcase.output));
    string input = read_file_content(input_path);
    try {
        apply_compare_result(cmp.compare(user_out, answer, input, testcase.full_score), result);
    } catch (checker_error &ex) {
        LOG(WARNING) << "Special judge failed on task " << t.id << ", testcase " << testcase.input << ": " << ex.what();
        result.result = status::SYSTEM_ERROR;
        result.score = 0;
        result.message = ex.what();
    }
}

void judge_pipeline::judge_answers(comparator &cmp) {
    fs::path answer_dir = config.run_dir / ("hjudge-answer-" + boost::lexical_cast<string>(boost::uuids::random_generator()()));
    fs::create_directories(answer_dir);
    defer {
        error_code ec;
        fs::remove_all(answer_dir, ec);
    };

    fs::path archive = answer_dir / "answer.zip";
    write_file_content(archive, t.options.answer_data);
    fs::path extracted = answer_dir / "answers";
    fs::create_directories(extracted);
    int ret = call_process({"unzip", "-j", "-o", "-q", archive.string(), "-d", extracted.string()});
    if (ret != 0)
        LOG(WARNING) << "Unable to extract answers of task " << t.id << ", unzip exited with " << ret;

    judge_subtasks([&](const subtask_info &, const testcase_info &testcase, testcase_result &result) {
        transition(pipeline_state::CHECKING);
        result.time = 0;
        result.memory = 0;
        result.score = 0;

        fs::path answer_file = extracted / fs::path(assert_safe_path(testcase.output)).filename();
        if (!fs::is_regular_file(answer_file)) {
            result.result = status::WRONG_ANSWER;
            result.message = "Missing file: " + testcase.output;
            return;
        }

        string user_out = read_file_content(answer_file);
        string answer = read_file_content(problem_dir / assert_safe_path(testcase.output));
        string input = read_file_content(problem_dir / assert_safe_path(testcase.input));
        try {
            apply_compare_result(cmp.compare(user_out, answer, input, testcase.full_score), result);
        } catch (checker_error &ex) {
            LOG(WARNING) << "Special judge failed on task " << t.id << ", testcase " << testcase.input << ": " << ex.what();
            result.result = status::SYSTEM_ERROR;
            result.message = ex.what();
        }
    });
}

void judge_pipeline::run_ide(sandbox::sandbox &box) {
    // 在线 IDE 的编译和运行使用相同的时间和内存限制
    if (!compile(box, t.ide.parameter, t.ide.time_limit, t.ide.compile_result_length_limit, t.ide.memory_limit << 20))
        return;

    transition(pipeline_state::RUNNING);
    box.put_file("in", t.input);
    progress("Running..");

    execution_limits limits = program_limits(t.ide.time_limit / 1000.0, t.ide.memory_limit << 20);
    limits.output = IDE_OUTPUT_LIMIT;
    limits.output_files = {"out"};
    limits.capture = max<int64_t>(t.ide.result_length_limit, 0);
    execution_result run = runner.run(box, lang.run_command(lang.output_name(DEFAULT_PROGRAM_FILENAME), "< in > out"), limits);
    if (run.cause == termination_cause::SANDBOX_INTERNAL_ERROR)
        BOOST_THROW_EXCEPTION(sandbox_error() << "unable to run user program: " << run.error);

    size_t length_limit = max<int64_t>(t.ide.result_length_limit, 0);
    bool truncated = false;
    report.stdout_text = box.exists("out") ? box.read_file("out", length_limit, &truncated) : "";
    if (truncated) report.stdout_text += "\n[Truncated]";
    report.stderr_text = truncate_text(run.stderr_text, length_limit);
    report.exit_code = run.exit_code;
    report.time = static_cast<int64_t>(ceil(run.time * 1000));
    report.memory = run.memory;

    switch (run.cause) {
        case termination_cause::TIME_LIMIT_EXCEEDED: report.result = status::TIME_LIMIT_EXCEEDED; break;
        case termination_cause::MEMORY_LIMIT_EXCEEDED: report.result = status::MEMORY_LIMIT_EXCEEDED; break;
        case termination_cause::OUTPUT_LIMIT_EXCEEDED: report.result = status::OUTPUT_LIMIT_EXCEEDED; break;
        case termination_cause::RUNTIME_ERROR: report.result = status::RUNTIME_ERROR; break;
        default: report.result = status::ACCEPTED; break;
    }

    report.message = fmt::format("{}\nExit code: {}\nMemory usage: {} KB\nTime usage: {} ms\nStandard output:\n{}\nStandard error:\n{}\n",
                                 report.result == status::ACCEPTED ? "Finished" : get_display_message(report.result),
                                 report.exit_code, report.memory / 1024, report.time,
                                 report.stdout_text, report.stderr_text);
    transition(pipeline_state::DONE);
}

}  // namespace hjudge
