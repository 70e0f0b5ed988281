#pragma once

#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"

namespace grader::server {

/**
 * @brief 向消息队列发送消息的类
 */
struct rabbitmq {
    explicit rabbitmq(const amqp &amqp);

    /**
     * @brief 发送一条消息，连接断开时会重连后重试
     */
    void report(const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    grader::server::amqp queue;
    std::mutex mut;
};

}  // namespace grader::server
