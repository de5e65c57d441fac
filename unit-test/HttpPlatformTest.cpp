#include <atomic>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "monitor/monitor.hpp"
#include "server/http_platform.hpp"
#include "test/workspace.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace hjudge;
using namespace hjudge::server;
using namespace nlohmann;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
namespace fs = std::filesystem;

static net::http_response respond(long status_code, const json &body) {
    net::http_response resp;
    resp.status_code = status_code;
    resp.body = body.dump();
    return resp;
}

static net::http_response ok(const json &data = nullptr) {
    return respond(200, {{"code", 0}, {"message", ""}, {"data", data}});
}

struct delivery_failure_counter : public monitor {
    atomic<int> failures{0};

    void report_delivery_failed(const task &, const string &) override {
        ++failures;
    }
};

class HttpPlatformTest : public ::testing::Test {
protected:
    HttpPlatformTest() {
        config.web_api_url = "http://judge.local/";
        config.judger_uuid = "uuid-1";
        config.result_retry_times = 3;
        config.result_retry_interval_ms = 1;
    }

    void TearDown() override {
        clear_monitors();
    }

    http_platform make_platform() {
        return http_platform(config, transport.AsStdFunction(), downloader.AsStdFunction());
    }

    static task judge_task() {
        task t;
        t.id = "task-1";
        t.kind = task_kind::LOCAL_JUDGE;
        t.submission_id = 42;
        return t;
    }

    judger_config config;
    ::testing::MockFunction<net::http_response(const string &, const map<string, string> &)> transport;
    ::testing::MockFunction<void(const string &, const map<string, string> &, const fs::path &)> downloader;
};

TEST_F(HttpPlatformTest, GetLanguageConfig) {
    json lang = {{"source_file", "{filename}.cpp"}, {"output_file", "{filename}"}, {"compile", "g++ {source} -o {output} {extra}"}, {"run", "./{program} {redirect}"}};
    map<string, string> fields;
    EXPECT_CALL(transport, Call("http://judge.local/api/judge/get_lang_config_as_json", _))
        .WillOnce(::testing::DoAll(::testing::SaveArg<1>(&fields), Return(ok(lang.dump()))));

    auto platform = make_platform();
    language_config result = platform.get_language_config("cpp17");
    EXPECT_EQ(result.id, "cpp17");
    EXPECT_EQ(result.compile_command("user-app", "-O2"), "g++ user-app.cpp -o user-app -O2");
    EXPECT_EQ(fields["uuid"], "uuid-1");
    EXPECT_EQ(fields["lang_id"], "cpp17");
}

TEST_F(HttpPlatformTest, GetProblemInfo) {
    json problem = {{"id", 7},
                    {"spj_filename", ""},
                    {"using_file_io", 1},
                    {"input_file_name", "a.in"},
                    {"output_file_name", "a.out"},
                    {"provides", {"grader.h"}},
                    {"subtasks", {{{"name", "sub1"}, {"score", 100}, {"method", "min"}, {"time_limit", 1000}, {"memory_limit", 256}, {"testcases", {{{"input", "1.in"}, {"output", "1.out"}, {"full_score", 100}}}}}}}};
    EXPECT_CALL(transport, Call("http://judge.local/api/judge/get_problem_info", _)).WillOnce(Return(ok(problem)));

    auto platform = make_platform();
    problem_info info = platform.get_problem_info(7);
    EXPECT_EQ(info.id, 7);
    EXPECT_TRUE(info.using_file_io);
    EXPECT_EQ(info.provides, vector<string>({"grader.h"}));
    ASSERT_EQ(info.subtasks.size(), 1u);
    EXPECT_EQ(info.subtasks[0].method, "min");
    EXPECT_EQ(info.subtasks[0].testcases[0].full_score, 100);
}

TEST_F(HttpPlatformTest, ErrorResponses) {
    auto platform = make_platform();

    EXPECT_CALL(transport, Call(_, _)).WillOnce(Return(respond(200, {{"code", 1}, {"message", "No such problem"}})));
    EXPECT_THROW(platform.get_problem_info(1), platform_error);

    EXPECT_CALL(transport, Call(_, _)).WillOnce(Return(respond(502, json::object())));
    EXPECT_THROW(platform.get_problem_info(1), network_error);

    EXPECT_CALL(transport, Call(_, _)).WillOnce(Return(respond(404, json::object())));
    EXPECT_THROW(platform.get_problem_info(1), platform_error);

    net::http_response garbage;
    garbage.status_code = 200;
    garbage.body = "<html>";
    EXPECT_CALL(transport, Call(_, _)).WillOnce(Return(garbage));
    EXPECT_THROW(platform.get_problem_info(1), platform_error);
}

TEST_F(HttpPlatformTest, SendResultRetriesNetworkErrors) {
    EXPECT_CALL(transport, Call("http://judge.local/api/judge/update", _))
        .WillOnce(Throw(network_error("connection refused")))
        .WillOnce(Return(respond(503, json::object())))
        .WillOnce(Return(ok()));

    auto platform = make_platform();
    submission_report report;
    report.result = status::ACCEPTED;
    EXPECT_TRUE(platform.send_result(judge_task(), report));
}

TEST_F(HttpPlatformTest, SendResultGivesUp) {
    auto counter = make_unique<delivery_failure_counter>();
    auto &failures = counter->failures;
    register_monitor(move(counter));

    EXPECT_CALL(transport, Call(_, _)).Times(3).WillRepeatedly(Throw(network_error("connection refused")));
    auto platform = make_platform();
    EXPECT_FALSE(platform.send_result(judge_task(), submission_report()));
    EXPECT_EQ(failures.load(), 1);
}

TEST_F(HttpPlatformTest, PlatformErrorIsNotRetried) {
    EXPECT_CALL(transport, Call(_, _)).Times(1).WillOnce(Return(respond(200, {{"code", 2}, {"message", "Submission not found"}})));
    auto platform = make_platform();
    EXPECT_FALSE(platform.send_result(judge_task(), submission_report()));
}

TEST_F(HttpPlatformTest, InvalidUtf8IsReplaced) {
    map<string, string> fields;
    EXPECT_CALL(transport, Call(_, _)).WillOnce(::testing::DoAll(::testing::SaveArg<1>(&fields), Return(ok())));

    submission_report report;
    report.result = status::WRONG_ANSWER;
    report.message = "read \xff";
    subtask_result subtask;
    subtask.name = "sub1";
    subtask.result = status::WRONG_ANSWER;
    testcase_result testcase;
    testcase.input = "1.in";
    testcase.output = "1.out";
    testcase.result = status::WRONG_ANSWER;
    // Special Judge 原样输出了用户的答案，并且截断在多字节字符中间
    testcase.message = "expected 5, found \xff\xfe \xe4\xb8";
    subtask.testcases.push_back(testcase);
    report.subtasks.push_back(subtask);

    auto platform = make_platform();
    EXPECT_TRUE(platform.send_result(judge_task(), report));

    json result = json::parse(fields["judge_result"]);
    EXPECT_EQ(result["sub1"]["testcases"][0]["message"], "expected 5, found \xef\xbf\xbd\xef\xbf\xbd \xef\xbf\xbd\xef\xbf\xbd");
    EXPECT_EQ(fields["message"], "read \xef\xbf\xbd");
}

TEST_F(HttpPlatformTest, UnencodableResultIsReportedAsFailure) {
    auto counter = make_unique<delivery_failure_counter>();
    auto &failures = counter->failures;
    register_monitor(move(counter));

    EXPECT_CALL(transport, Call(_, _)).WillOnce(Throw(std::runtime_error("unexpected")));
    auto platform = make_platform();
    EXPECT_FALSE(platform.send_result(judge_task(), submission_report()));
    EXPECT_EQ(failures.load(), 1);
}

TEST_F(HttpPlatformTest, ResultFields) {
    map<string, string> fields;
    EXPECT_CALL(transport, Call(_, _)).WillOnce(::testing::DoAll(::testing::SaveArg<1>(&fields), Return(ok())));

    submission_report report;
    report.result = status::COMPILE_ERROR;
    report.message = "main.cpp:1: error";
    auto platform = make_platform();
    EXPECT_TRUE(platform.send_result(judge_task(), report));

    EXPECT_EQ(fields["submission_id"], "42");
    EXPECT_EQ(fields["message"], "main.cpp:1: error");
    EXPECT_EQ(fields["extra_status"], "compile_error");
    EXPECT_JSON_EQ(json::parse(fields["judge_result"]), json::object());
    EXPECT_EQ(fields["uuid"], "uuid-1");
}

TEST_F(HttpPlatformTest, IdeUpdates) {
    vector<map<string, string>> calls;
    EXPECT_CALL(transport, Call("http://judge.local/api/ide/update", _))
        .Times(2)
        .WillRepeatedly(::testing::Invoke([&](const string &, const map<string, string> &fields) {
            calls.push_back(fields);
            return ok();
        }));

    task t;
    t.kind = task_kind::IDE_RUN;
    t.run_id = "run-9";
    auto platform = make_platform();
    platform.send_progress(t, submission_report(), "Running..");
    platform.send_result(t, submission_report());

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0]["run_id"], "run-9");
    EXPECT_EQ(calls[0]["status"], "running");
    EXPECT_EQ(calls[0]["message"], "Running..");
    EXPECT_EQ(calls[1]["status"], "done");
}

TEST_F(HttpPlatformTest, ProgressFailuresAreIgnored) {
    EXPECT_CALL(transport, Call(_, _)).Times(http_platform::PROGRESS_ATTEMPTS).WillRepeatedly(Throw(network_error("timeout")));
    auto platform = make_platform();
    EXPECT_NO_THROW(platform.send_progress(judge_task(), submission_report(), "Compiling your program.."));
}

TEST_F(HttpPlatformTest, SyncProblemFiles) {
    test::temp_workspace workspace;
    fs::path dir = workspace.root / "1";
    workspace.write("1/stale.in", "old");
    workspace.write("1/1.in", "2 3\n");
    hjudge::last_write_time(dir / "1.in", 1600000000);

    json files = {{{"name", "1.in"}, {"last_modified_time", 1600000000.0}},
                  {{"name", "1.out"}, {"last_modified_time", 1600000500.5}}};
    EXPECT_CALL(transport, Call("http://judge.local/api/judge/get_file_list", _)).WillOnce(Return(ok(files)));
    EXPECT_CALL(downloader, Call("http://judge.local/api/judge/download_file", _, dir / "1.out"))
        .WillOnce(::testing::Invoke([](const string &, const map<string, string> &fields, const fs::path &path) {
            EXPECT_EQ(fields.at("filename"), "1.out");
            EXPECT_EQ(fields.at("problem_id"), "1");
            write_file_content(path, "5\n");
        }));

    auto platform = make_platform();
    platform.sync_problem_files(1, dir);

    EXPECT_FALSE(fs::exists(dir / "stale.in"));
    EXPECT_EQ(read_file_content(dir / "1.in"), "2 3\n");
    EXPECT_EQ(read_file_content(dir / "1.out"), "5\n");
    EXPECT_EQ(hjudge::last_write_time(dir / "1.out"), 1600000500);
}
