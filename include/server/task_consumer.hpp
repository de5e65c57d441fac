#pragma once

#include <atomic>
#include <cstdint>
#include <utility>
#include "common/concurrent_queue.hpp"
#include "judge/task.hpp"
#include "server/broker.hpp"

namespace hjudge::server {

/**
 * @brief 从消息队列中取出并解析完成的任务
 */
struct delivery {
    std::uint64_t delivery_tag = 0;
    task t;
};

/**
 * @brief 消费者线程，负责从消息队列拉取任务并分发给 worker
 *
 * 消息队列的信道只在消费者线程中使用：worker 完成任务后调用 ack，
 * 确认请求被放入队列，由消费者线程在下一次 poll_once 时执行。
 * 本地缓冲区最多保存 prefetch_count 个还未开始评测的任务，缓冲区已满时不拉取新消息。
 */
struct task_consumer {
    task_consumer(message_broker &broker, std::size_t prefetch_count);

    /**
     * @brief 执行一轮消费：处理所有待确认的消息，若缓冲区有空位则拉取一条消息
     * 格式错误的消息会被直接拒绝，不会进入缓冲区。
     * 消息队列的错误只记录日志，不会抛出。
     * 只能在消费者线程中调用。
     * @param timeout_ms 拉取消息或者等待确认请求的最长时间
     * @return 是否有新任务进入缓冲区
     */
    bool poll_once(int timeout_ms);

    /**
     * @brief 消费者线程的主循环
     * 调用 stop 之后不再拉取新消息，但仍然处理确认请求，直到 shutdown 被调用为止。
     */
    void run();

    /**
     * @brief worker 获取下一个任务，缓冲区为空时阻塞
     * @return 若消费者已停止，返回 false
     */
    bool next(delivery &d);

    /**
     * @brief 请求确认消息，可以在任何线程中调用
     */
    void ack(std::uint64_t delivery_tag);

    /**
     * @brief 请求拒绝消息，消息不会被重新投递
     */
    void reject(std::uint64_t delivery_tag);

    /**
     * @brief 停止拉取新任务，唤醒所有等待任务的 worker
     * 缓冲区中还未开始的任务不会被确认，连接断开后由消息队列重新投递。
     */
    void stop();

    /**
     * @brief 所有 worker 退出后调用，处理完剩余的确认请求后 run 返回
     */
    void shutdown();

    /**
     * @brief 缓冲区中还未开始评测的任务数
     */
    std::size_t buffered() const;

private:
    /**
     * @brief 执行一个确认请求，失败时记录日志
     * @param request 消息编号，以及是否确认（否则拒绝）
     */
    void settle(const std::pair<std::uint64_t, bool> &request);

    message_broker &broker;
    concurrent_queue<delivery> buffer;
    concurrent_queue<std::pair<std::uint64_t, bool>> settlements;
    std::atomic<bool> stopped{false};
};

}  // namespace hjudge::server
