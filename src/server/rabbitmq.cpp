#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <unistd.h>

namespace grader::server {
using namespace std;

rabbitmq::rabbitmq(const amqp &amqp) : queue(amqp) {
    connect();
}

void rabbitmq::connect() {
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
}

void rabbitmq::report(const string &message) {
    lock_guard<mutex> guard(mut);
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << queue.routing_key << std::endl
               << message;

    int retry = 3;
    while (true) {
        try {
            channel->BasicPublish(queue.exchange, queue.routing_key, msg);
            break;
        } catch (std::exception &e) {
            if (--retry <= 0) throw;
            LOG(WARNING) << "Failed to publish message, reconnecting: " << e.what();
            sleep(1);
            connect();
        }
    }
    DLOG(INFO) << "Sending message succeeded";
}

}  // namespace grader::server
