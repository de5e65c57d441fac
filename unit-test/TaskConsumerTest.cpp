#include <atomic>
#include <thread>
#include "gtest/gtest.h"
#include "monitor/monitor.hpp"
#include "server/task_consumer.hpp"
#include "test/fake_broker.hpp"
#include "test/messages.hpp"

using namespace std;
using namespace hjudge;
using namespace hjudge::server;
using namespace hjudge::test;

struct rejection_counter : public monitor {
    atomic<int> rejected{0};

    void task_rejected(const string &) override {
        ++rejected;
    }
};

class TaskConsumerTest : public ::testing::Test {
protected:
    void TearDown() override {
        clear_monitors();
    }

    fake_broker broker;
};

TEST_F(TaskConsumerTest, DecodedTaskIsBuffered) {
    task_consumer consumer(broker, 2);
    broker.publish(local_judge_headers("t1"), local_judge_body(10, 1, "adder"));

    EXPECT_TRUE(consumer.poll_once(1));
    EXPECT_EQ(consumer.buffered(), 1u);

    delivery d;
    ASSERT_TRUE(consumer.next(d));
    EXPECT_EQ(d.delivery_tag, 1u);
    EXPECT_EQ(d.t.id, "t1");
    EXPECT_EQ(d.t.submission_id, 10);
    EXPECT_EQ(consumer.buffered(), 0u);
}

TEST_F(TaskConsumerTest, MalformedMessageIsRejected) {
    auto counter = make_unique<rejection_counter>();
    auto &rejected = counter->rejected;
    register_monitor(move(counter));

    task_consumer consumer(broker, 2);
    broker.publish({}, "[[], {}, {}]");
    broker.publish({{"task", "judgers.remote.run"}}, "[[], {}, {}]");

    EXPECT_FALSE(consumer.poll_once(1));
    EXPECT_FALSE(consumer.poll_once(1));
    EXPECT_EQ(consumer.buffered(), 0u);
    EXPECT_EQ(broker.rejected_tags(), vector<uint64_t>({1, 2}));
    EXPECT_TRUE(broker.acked_tags().empty());
    EXPECT_EQ(rejected.load(), 2);
}

TEST_F(TaskConsumerTest, FullBufferStopsFetching) {
    task_consumer consumer(broker, 2);
    for (int i = 0; i < 3; ++i)
        broker.publish(local_judge_headers("t" + to_string(i)), local_judge_body(i, 1, "adder"));

    EXPECT_TRUE(consumer.poll_once(1));
    EXPECT_TRUE(consumer.poll_once(1));
    EXPECT_FALSE(consumer.poll_once(1));
    EXPECT_EQ(consumer.buffered(), 2u);
    EXPECT_EQ(broker.remaining(), 1u);

    delivery d;
    ASSERT_TRUE(consumer.next(d));
    EXPECT_TRUE(consumer.poll_once(1));
    EXPECT_EQ(broker.remaining(), 0u);
}

TEST_F(TaskConsumerTest, AcknowledgementsRunOnConsumerThread) {
    task_consumer consumer(broker, 2);
    consumer.ack(5);
    consumer.reject(6);
    EXPECT_TRUE(broker.acked_tags().empty());

    consumer.poll_once(1);
    EXPECT_EQ(broker.acked_tags(), vector<uint64_t>({5}));
    EXPECT_EQ(broker.rejected_tags(), vector<uint64_t>({6}));
}

TEST_F(TaskConsumerTest, StopWakesWaitingWorkers) {
    task_consumer consumer(broker, 2);
    atomic<bool> returned{false};
    thread worker([&] {
        delivery d;
        EXPECT_FALSE(consumer.next(d));
        returned = true;
    });
    this_thread::sleep_for(chrono::milliseconds(20));
    EXPECT_FALSE(returned);
    consumer.stop();
    worker.join();
    EXPECT_TRUE(returned);
}

TEST_F(TaskConsumerTest, RunSettlesAcknowledgementsUntilShutdown) {
    task_consumer consumer(broker, 2);
    thread consumer_thread([&] { consumer.run(); });

    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "adder"));
    delivery d;
    ASSERT_TRUE(consumer.next(d));

    consumer.stop();
    // 停止之后 worker 完成的任务仍然要被确认
    consumer.ack(d.delivery_tag);
    consumer.shutdown();
    consumer_thread.join();

    EXPECT_EQ(broker.acked_tags(), vector<uint64_t>({d.delivery_tag}));
}

TEST_F(TaskConsumerTest, FailedAcknowledgementKeepsConsuming) {
    task_consumer consumer(broker, 2);
    thread consumer_thread([&] { consumer.run(); });

    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "adder"));
    delivery first;
    ASSERT_TRUE(consumer.next(first));
    broker.fail_acks(1);
    consumer.ack(first.delivery_tag);

    broker.publish(local_judge_headers("t2"), local_judge_body(2, 1, "adder"));
    delivery second;
    ASSERT_TRUE(consumer.next(second));
    EXPECT_EQ(second.t.id, "t2");
    consumer.ack(second.delivery_tag);

    consumer.stop();
    consumer.shutdown();
    consumer_thread.join();
    EXPECT_EQ(broker.acked_tags(), vector<uint64_t>({second.delivery_tag}));
}

TEST_F(TaskConsumerTest, FailedFetchIsRetried) {
    task_consumer consumer(broker, 2);
    broker.publish(local_judge_headers("t1"), local_judge_body(1, 1, "adder"));
    broker.fail_fetches(2);

    EXPECT_FALSE(consumer.poll_once(1));
    EXPECT_FALSE(consumer.poll_once(1));
    EXPECT_TRUE(consumer.poll_once(1));
    EXPECT_EQ(consumer.buffered(), 1u);
    EXPECT_EQ(broker.fetch_count(), 3);
}
