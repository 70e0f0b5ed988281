#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type;

    /**
     * @brief AMQP 消息队列的队列名
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;
};

void from_json(const nlohmann::json &j, amqp &mq);

}  // namespace grader::server
