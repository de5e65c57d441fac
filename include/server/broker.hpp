#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace hjudge::server {

/**
 * @brief 从消息队列收到的一条原始消息
 */
struct broker_message {
    /**
     * @brief 消息在信道内的编号，用于确认或拒绝消息
     */
    std::uint64_t delivery_tag = 0;

    /**
     * @brief 消息头中字符串类型的字段
     */
    std::map<std::string, std::string> headers;

    std::string body;

    /**
     * @brief 消息是否是被重新投递的
     */
    bool redelivered = false;
};

/**
 * @brief 消息队列的一个消费者
 * 所有方法只能在同一个线程中调用。
 */
struct message_broker {
    virtual ~message_broker();

    /**
     * @brief 拉取一条消息
     * @param timeout_ms 最长等待时间
     * @return 是否拉取到消息
     */
    virtual bool fetch(broker_message &message, int timeout_ms) = 0;

    /**
     * @brief 确认消息已经处理完成
     */
    virtual void ack(std::uint64_t delivery_tag) = 0;

    /**
     * @brief 拒绝消息，消息不会被重新投递
     */
    virtual void reject(std::uint64_t delivery_tag) = 0;
};

}  // namespace hjudge::server
