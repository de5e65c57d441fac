#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <thread>

namespace hjudge::server {
using namespace std;

message_broker::~message_broker() = default;

rabbitmq::rabbitmq(const string &uri, const string &queue, int prefetch_count)
    : uri(uri), queue(queue), prefetch_count(prefetch_count) {
    connect();
}

void rabbitmq::connect() {
    envelopes.clear();
    channel = AmqpClient::Channel::CreateFromUri(uri);
    channel->DeclareQueue(queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->BasicConsume(queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, prefetch_count);
    LOG(INFO) << "Consuming queue " << queue << " with prefetch count " << prefetch_count;
}

bool rabbitmq::fetch(broker_message &message, int timeout_ms) {
    AmqpClient::Envelope::ptr_t envelope;
    int retry = 5;
    while (true) {
        try {
            if (!channel->BasicConsumeMessage(envelope, timeout_ms)) return false;
            break;
        } catch (std::exception &e) {
            if (--retry <= 0) throw;
            LOG(WARNING) << "Lost connection to message queue: " << e.what() << ", reconnecting";
            this_thread::sleep_for(chrono::seconds(5));
            connect();
        }
    }

    message = broker_message();
    message.delivery_tag = envelope->DeliveryTag();
    message.redelivered = envelope->Redelivered();
    auto msg = envelope->Message();
    message.body = msg->Body();
    if (msg->HeaderTableIsSet()) {
        for (auto &[key, value] : msg->HeaderTable())
            if (value.GetType() == AmqpClient::TableValue::VT_string)
                message.headers[key] = value.GetString();
    }
    envelopes[message.delivery_tag] = envelope;
    return true;
}

void rabbitmq::settle(uint64_t delivery_tag, bool ack) {
    const char *action = ack ? "acknowledge" : "reject";
    auto it = envelopes.find(delivery_tag);
    if (it == envelopes.end()) {
        LOG(WARNING) << "Unable to " << action << " message " << delivery_tag << ", the channel has been reconnected";
        return;
    }
    auto envelope = it->second;
    envelopes.erase(it);
    try {
        if (ack)
            channel->BasicAck(envelope);
        else
            channel->BasicReject(envelope, /* requeue */ false);
    } catch (std::exception &e) {
        // 出错的信道不能再使用，其余未确认的消息随之失效
        LOG(WARNING) << "Unable to " << action << " message " << delivery_tag << ": " << e.what() << ", reconnecting";
        connect();
    }
}

void rabbitmq::ack(uint64_t delivery_tag) {
    settle(delivery_tag, true);
}

void rabbitmq::reject(uint64_t delivery_tag) {
    settle(delivery_tag, false);
}

}  // namespace hjudge::server
