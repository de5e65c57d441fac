#include <atomic>
#include <boost/algorithm/string.hpp>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "monitor/monitor.hpp"
#include "test/fake_broker.hpp"
#include "test/fake_runtime.hpp"
#include "test/messages.hpp"
#include "test/mock_platform.hpp"
#include "test/workspace.hpp"
#include "worker.hpp"

using namespace std;
using namespace hjudge;
using namespace hjudge::test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
namespace fs = std::filesystem;

/**
 * @brief 编译时复制源代码，运行时输出 5
 */
static fake_process echo_five(const string &command, const fs::path &dir) {
    vector<string> tokens;
    boost::split(tokens, command, boost::is_any_of(" "), boost::token_compress_on);
    if (tokens[0] == "g++")
        write_file_content(dir / tokens[3], read_file_content(dir / tokens[1]));
    else
        write_file_content(dir / "out", "5\n");
    return fake_process();
}

struct task_counter : public monitor {
    atomic<int> started{0}, ended{0}, accepted{0};

    void start_task(int, const task &) override {
        ++started;
    }

    void end_task(int, const task &, status result) override {
        ++ended;
        if (result == status::ACCEPTED) ++accepted;
    }
};

class WorkerTest : public ::testing::Test {
protected:
    WorkerTest() : runtime(echo_five) {
        config.data_dir = workspace.root / "data";
        config.run_dir = workspace.root / "run";
        config.max_tasks_sametime = 2;
        fs::create_directories(config.run_dir);

        sandbox::sandbox_options options;
        options.image = "hjudge-test";
        options.run_dir = config.run_dir;
        options.poll_interval = chrono::milliseconds(1);
        runner = make_unique<sandbox::sandbox_runner>(runtime, options);

        language_config lang;
        lang.source_file = "{filename}.cpp";
        lang.output_file = "{filename}";
        lang.compile = "g++ {source} -o {output}";
        lang.run = "./{program} {redirect}";

        problem_info problem;
        problem.id = 1;
        subtask_info subtask;
        subtask.name = "sub1";
        subtask.score = 100;
        subtask.time_limit = 1000;
        subtask.memory_limit = 64;
        subtask.testcases = {{"1.in", "1.out", 100}};
        problem.subtasks = {subtask};
        workspace.write("data/1/1.in", "2 3\n");
        workspace.write("data/1/1.out", "5\n");

        ON_CALL(platform, get_language_config(_)).WillByDefault(Return(lang));
        ON_CALL(platform, get_problem_info(_)).WillByDefault(Return(problem));
    }

    void TearDown() override {
        clear_monitors();
    }

    temp_workspace workspace;
    judger_config config;
    fake_runtime runtime;
    unique_ptr<sandbox::sandbox_runner> runner;
    NiceMock<recording_platform> platform;
    fake_broker broker;
};

TEST_F(WorkerTest, JudgeTaskReportsAndAcknowledges) {
    auto counter = make_unique<task_counter>();
    auto &c = *counter;
    register_monitor(move(counter));

    server::task_consumer consumer(broker, 2);
    concurrency_controller controller(1);
    worker_context ctx{config, platform, *runner, consumer, controller};

    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "int main(){}"));
    ASSERT_TRUE(consumer.poll_once(1));
    server::delivery d;
    ASSERT_TRUE(consumer.next(d));

    auto report = judge_task(0, d, ctx, "1");
    EXPECT_EQ(report.result, status::ACCEPTED);
    ASSERT_EQ(platform.delivered().size(), 1u);
    EXPECT_EQ(platform.delivered()[0].score, 100);
    EXPECT_EQ(runtime.specs().back().cpuset, "1");

    consumer.poll_once(1);
    EXPECT_EQ(broker.acked_tags(), vector<uint64_t>({d.delivery_tag}));
    EXPECT_EQ(c.started.load(), 1);
    EXPECT_EQ(c.ended.load(), 1);
    EXPECT_EQ(c.accepted.load(), 1);
}

TEST_F(WorkerTest, UndeliveredResultIsStillAcknowledged) {
    ON_CALL(platform, send_result(_, _)).WillByDefault(Return(false));
    server::task_consumer consumer(broker, 2);
    concurrency_controller controller(1);
    worker_context ctx{config, platform, *runner, consumer, controller};

    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "int main(){}"));
    ASSERT_TRUE(consumer.poll_once(1));
    server::delivery d;
    ASSERT_TRUE(consumer.next(d));
    judge_task(0, d, ctx);

    consumer.poll_once(1);
    EXPECT_EQ(broker.acked_tags(), vector<uint64_t>({d.delivery_tag}));
}

TEST_F(WorkerTest, WorkersDrainQueue) {
    server::task_consumer consumer(broker, config.prefetch_count);
    concurrency_controller controller(config.max_tasks_sametime);
    worker_context ctx{config, platform, *runner, consumer, controller};

    const size_t tasks = 6;
    for (size_t i = 0; i < tasks; ++i)
        broker.publish(local_judge_headers("t" + to_string(i)), local_judge_body(static_cast<int64_t>(i), 1, "int main(){}"));
    broker.publish({}, "malformed");

    thread consumer_thread([&] { consumer.run(); });
    vector<thread> workers;
    for (int i = 0; i < config.max_tasks_sametime; ++i)
        workers.push_back(start_worker(i, ctx));

    auto deadline = chrono::steady_clock::now() + chrono::seconds(30);
    while (broker.acked_tags().size() < tasks && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(5));

    stop_workers(ctx);
    consumer.stop();
    for (auto &th : workers) th.join();
    consumer.shutdown();
    consumer_thread.join();

    EXPECT_EQ(broker.acked_tags().size(), tasks);
    EXPECT_EQ(broker.rejected_tags().size(), 1u);
    EXPECT_EQ(platform.delivered().size(), tasks);
    for (auto &report : platform.delivered())
        EXPECT_EQ(report.result, status::ACCEPTED);
    EXPECT_LE(controller.peak(), config.max_tasks_sametime);
    EXPECT_LE(runner->peak(), config.max_tasks_sametime);
    EXPECT_EQ(runner->active(), 0);
}

TEST_F(WorkerTest, StoppingOneContextLeavesOthersRunning) {
    server::task_consumer stopped_consumer(broker, 1);
    concurrency_controller stopped_controller(1);
    worker_context stopped{config, platform, *runner, stopped_consumer, stopped_controller};
    stop_workers(stopped);
    start_worker(0, stopped).join();

    server::task_consumer consumer(broker, 1);
    concurrency_controller controller(1);
    worker_context ctx{config, platform, *runner, consumer, controller};
    EXPECT_FALSE(ctx.stopping);

    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "int main(){}"));
    thread consumer_thread([&] { consumer.run(); });
    thread worker = start_worker(0, ctx);

    auto deadline = chrono::steady_clock::now() + chrono::seconds(30);
    while (broker.acked_tags().empty() && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(5));

    stop_workers(ctx);
    consumer.stop();
    worker.join();
    consumer.shutdown();
    consumer_thread.join();

    EXPECT_EQ(broker.acked_tags().size(), 1u);
    EXPECT_EQ(platform.delivered().size(), 1u);
}
