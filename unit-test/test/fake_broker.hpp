#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "server/broker.hpp"

namespace hjudge::test {

/**
 * @brief 保存在内存中的消息队列
 */
struct fake_broker : public server::message_broker {
    void publish(const std::map<std::string, std::string> &headers, const std::string &body, bool redelivered = false) {
        std::scoped_lock<std::mutex> lock(mut);
        server::broker_message message;
        message.delivery_tag = ++next_tag;
        message.headers = headers;
        message.body = body;
        message.redelivered = redelivered;
        pending.push_back(message);
    }

    bool fetch(server::broker_message &message, int timeout_ms) override {
        {
            std::scoped_lock<std::mutex> lock(mut);
            ++fetches;
            if (fetch_failures > 0) {
                --fetch_failures;
                throw std::runtime_error("connection reset by peer");
            }
            if (!pending.empty()) {
                message = pending.front();
                pending.pop_front();
                return true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 5)));
        return false;
    }

    void ack(std::uint64_t delivery_tag) override {
        std::scoped_lock<std::mutex> lock(mut);
        if (ack_failures > 0) {
            --ack_failures;
            throw std::runtime_error("channel error: PRECONDITION_FAILED - unknown delivery tag");
        }
        acked.push_back(delivery_tag);
    }

    void reject(std::uint64_t delivery_tag) override {
        std::scoped_lock<std::mutex> lock(mut);
        rejected.push_back(delivery_tag);
    }

    /**
     * @brief 接下来的 count 次 ack 抛出异常
     */
    void fail_acks(int count) {
        std::scoped_lock<std::mutex> lock(mut);
        ack_failures = count;
    }

    /**
     * @brief 接下来的 count 次 fetch 抛出异常
     */
    void fail_fetches(int count) {
        std::scoped_lock<std::mutex> lock(mut);
        fetch_failures = count;
    }

    std::vector<std::uint64_t> acked_tags() const {
        std::scoped_lock<std::mutex> lock(mut);
        return acked;
    }

    std::vector<std::uint64_t> rejected_tags() const {
        std::scoped_lock<std::mutex> lock(mut);
        return rejected;
    }

    std::size_t remaining() const {
        std::scoped_lock<std::mutex> lock(mut);
        return pending.size();
    }

    int fetch_count() const {
        std::scoped_lock<std::mutex> lock(mut);
        return fetches;
    }

private:
    mutable std::mutex mut;
    std::deque<server::broker_message> pending;
    std::vector<std::uint64_t> acked, rejected;
    std::uint64_t next_tag = 0;
    int fetches = 0;
    int ack_failures = 0, fetch_failures = 0;
};

}  // namespace hjudge::test
