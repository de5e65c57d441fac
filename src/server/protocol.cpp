#include "server/protocol.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include <vector>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace hjudge::server {
using namespace std;
using namespace nlohmann;

/**
 * @brief Celery 任务的参数，支持位置参数和关键字参数
 */
struct task_arguments {
    json args = json::array();
    json kwargs = json::object();

    const json &at(size_t position, const string &name) const {
        if (position < args.size()) return args.at(position);
        if (kwargs.count(name)) return kwargs.at(name);
        throw protocol_error() << "Missing argument " << name;
    }
};

template <typename T>
static T field(const json &j, const string &name, const string &key) {
    try {
        return get_value<T>(j, key);
    } catch (invalid_argument &) {
        throw protocol_error() << "Missing or mistyped field " << key << " of " << name;
    }
}

template <typename T>
static T optional_field(const json &j, const string &name, const string &key, const T &def) {
    try {
        return get_value_def<T>(j, def, key);
    } catch (invalid_argument &) {
        throw protocol_error() << "Mistyped field " << key << " of " << name;
    }
}

static void require_object(const json &j, const string &name) {
    if (!j.is_object())
        throw protocol_error() << "Argument " << name << " must be an object";
}

static task decode_local_judge(const task_arguments &arguments) {
    task t;
    t.kind = task_kind::LOCAL_JUDGE;

    const json &submission = arguments.at(0, "submission_data");
    require_object(submission, "submission_data");
    t.submission_id = field<int64_t>(submission, "submission_data", "id");
    t.problem_id = field<int64_t>(submission, "submission_data", "problem_id");
    t.language = field<string>(submission, "submission_data", "language");
    t.code = field<string>(submission, "submission_data", "code");

    const json &extra = arguments.at(1, "extra_config");
    require_object(extra, "extra_config");
    judge_options &options = t.options;
    options.compile_time_limit = field<int64_t>(extra, "extra_config", "compile_time_limit");
    options.compile_result_length_limit = field<int64_t>(extra, "extra_config", "compile_result_length_limit");
    options.spj_execute_time_limit = field<int64_t>(extra, "extra_config", "spj_execute_time_limit");
    options.extra_compile_parameter = field<string>(extra, "extra_config", "extra_compile_parameter");
    options.auto_sync_files = field<bool>(extra, "extra_config", "auto_sync_files");
    options.output_file_size_limit = field<int64_t>(extra, "extra_config", "output_file_size_limit");
    options.submit_answer = field<bool>(extra, "extra_config", "submit_answer");
    options.time_scale = optional_field<double>(extra, "extra_config", "time_scale", 1.0);

    string answer_data = optional_field<string>(extra, "extra_config", "answer_data", "");
    try {
        options.answer_data = base64_decode(answer_data);
    } catch (invalid_argument &ex) {
        throw protocol_error() << "Malformed answer_data: " << ex.what();
    }
    return t;
}

static task decode_ide_run(const task_arguments &arguments) {
    task t;
    t.kind = task_kind::IDE_RUN;

    auto string_argument = [&](size_t position, const string &name) {
        const json &value = arguments.at(position, name);
        if (!value.is_string()) throw protocol_error() << "Argument " << name << " must be a string";
        return value.get<string>();
    };
    t.language = string_argument(0, "lang_id");
    t.run_id = string_argument(1, "run_id");
    t.code = string_argument(2, "code");
    t.input = string_argument(3, "input");

    const json &extra = arguments.at(4, "extra_config");
    require_object(extra, "extra_config");
    ide_options &ide = t.ide;
    ide.compile_time_limit = field<int64_t>(extra, "extra_config", "compile_time_limit");
    ide.compile_result_length_limit = field<int64_t>(extra, "extra_config", "compile_result_length_limit");
    ide.time_limit = field<int64_t>(extra, "extra_config", "time_limit");
    ide.memory_limit = field<int64_t>(extra, "extra_config", "memory_limit");
    ide.result_length_limit = field<int64_t>(extra, "extra_config", "result_length_limit");
    ide.parameter = optional_field<string>(extra, "extra_config", "parameter", "");
    return t;
}

task decode_task(const broker_message &message) {
    json body;
    try {
        body = json::parse(message.body);
    } catch (json::exception &ex) {
        throw protocol_error() << "Malformed message body: " << ex.what();
    }

    string name, id;
    task_arguments arguments;
    if (message.headers.count("task")) {
        // 协议 v2
        name = message.headers.at("task");
        if (message.headers.count("id")) id = message.headers.at("id");
        if (!body.is_array() || body.size() < 2 || !body[0].is_array() || !body[1].is_object())
            throw protocol_error() << "Message body of task " << name << " must be [args, kwargs, embed]";
        arguments.args = body[0];
        arguments.kwargs = body[1];
    } else if (body.is_object() && body.count("task")) {
        // 协议 v1
        if (!body["task"].is_string())
            throw protocol_error("Task name must be a string");
        name = body["task"].get<string>();
        id = optional_field<string>(body, "message", "id", "");
        if (body.count("args")) arguments.args = body["args"];
        if (body.count("kwargs")) arguments.kwargs = body["kwargs"];
        if (!arguments.args.is_array() || !arguments.kwargs.is_object())
            throw protocol_error() << "Malformed arguments of task " << name;
    } else {
        throw protocol_error("Missing task name");
    }

    task t;
    if (name == LOCAL_JUDGE_TASK)
        t = decode_local_judge(arguments);
    else if (name == IDE_RUN_TASK)
        t = decode_ide_run(arguments);
    else if (name == REMOTE_JUDGE_TASK)
        throw protocol_error() << "Remote judging is not supported: " << name;
    else
        throw protocol_error() << "Unknown task " << name;

    t.id = id.empty() ? "delivery-" + to_string(message.delivery_tag) : id;
    return t;
}

// clang-format off
static const unordered_map<status, const char *> legacy_status_string = boost::assign::map_list_of
    (status::WAITING, "waiting")
    (status::JUDGING, "judging")
    (status::SKIPPED, "skipped")
    (status::ACCEPTED, "accepted")
    (status::WRONG_ANSWER, "wrong_answer")
    (status::TIME_LIMIT_EXCEEDED, "time_limit_exceed")
    (status::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceed")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::OUTPUT_LIMIT_EXCEEDED, "output_size_limit_exceed")
    (status::COMPILE_ERROR, "compile_error")
    (status::SYSTEM_ERROR, "judge_failed");
// clang-format on

const char *legacy_status(status s) {
    return legacy_status_string.at(s);
}

const char *legacy_subtask_status(status s) {
    if (!is_final(s) || s == status::ACCEPTED) return legacy_status(s);
    return "unaccepted";
}

json encode_judge_result(const submission_report &report) {
    json result = json::object();
    for (auto &subtask : report.subtasks) {
        json testcases = json::array();
        for (auto &testcase : subtask.testcases) {
            testcases.push_back({{"full_score", testcase.full_score},
                                 {"input", testcase.input},
                                 {"memory_cost", testcase.memory},
                                 {"message", sanitize_utf8(testcase.message)},
                                 {"output", testcase.output},
                                 {"score", testcase.score},
                                 {"status", legacy_status(testcase.result)},
                                 {"time_cost", testcase.time}});
        }
        result[subtask.name] = {{"score", subtask.score},
                                {"status", legacy_subtask_status(subtask.result)},
                                {"testcases", testcases}};
    }
    return result;
}

}  // namespace hjudge::server
