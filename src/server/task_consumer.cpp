#include "server/task_consumer.hpp"
#include <glog/logging.h>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"
#include "monitor/monitor.hpp"
#include "server/protocol.hpp"

namespace hjudge::server {
using namespace std;

task_consumer::task_consumer(message_broker &broker, size_t prefetch_count)
    : broker(broker), buffer(prefetch_count) {}

void task_consumer::settle(const pair<uint64_t, bool> &request) {
    try {
        if (request.second)
            broker.ack(request.first);
        else
            broker.reject(request.first);
    } catch (std::exception &ex) {
        // 未确认的消息在连接断开后由消息队列重新投递
        LOG(ERROR) << "Unable to " << (request.second ? "acknowledge" : "reject") << " message " << request.first << ": " << ex.what();
    }
}

bool task_consumer::poll_once(int timeout_ms) {
    pair<uint64_t, bool> request;
    while (settlements.try_pop(request)) settle(request);

    if (stopped || buffer.full()) {
        // 缓冲区已满时等待 worker 的确认请求，不能忙等
        if (settlements.pop_for(request, chrono::milliseconds(timeout_ms))) settle(request);
        return false;
    }

    broker_message message;
    try {
        if (!broker.fetch(message, timeout_ms)) return false;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to fetch message: " << ex.what();
        this_thread::sleep_for(chrono::milliseconds(timeout_ms));
        return false;
    }

    delivery d;
    d.delivery_tag = message.delivery_tag;
    try {
        d.t = decode_task(message);
    } catch (protocol_error &ex) {
        LOG(WARNING) << "Rejecting message " << message.delivery_tag << ": " << ex.what();
        settle({message.delivery_tag, false});
        string reason = ex.what();
        call_monitor([&](monitor &m) { m.task_rejected(reason); });
        return false;
    }

    if (message.redelivered)
        LOG(INFO) << "Task " << d.t.id << " is redelivered";
    DLOG(INFO) << "Received task " << d.t.id << " (" << message.headers["task"] << ")";

    if (!buffer.push(move(d))) {
        // stop 和 push 之间缓冲区被关闭，消息等待重新投递
        return false;
    }
    return true;
}

void task_consumer::run() {
    while (!stopped) poll_once(100);

    pair<uint64_t, bool> request;
    while (settlements.pop(request)) settle(request);
}

bool task_consumer::next(delivery &d) {
    if (stopped) return false;
    return buffer.pop(d) && !stopped;
}

void task_consumer::ack(uint64_t delivery_tag) {
    settlements.push({delivery_tag, true});
}

void task_consumer::reject(uint64_t delivery_tag) {
    settlements.push({delivery_tag, false});
}

void task_consumer::stop() {
    stopped = true;
    buffer.close();
}

void task_consumer::shutdown() {
    settlements.close();
}

size_t task_consumer::buffered() const {
    return buffer.size();
}

}  // namespace hjudge::server
