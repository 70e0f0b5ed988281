#pragma once

#include "report/channel.hpp"
#include "server/rabbitmq.hpp"

namespace grader {

/**
 * @brief 将消息发布到 RabbitMQ
 */
struct mq_channel : public channel {
    explicit mq_channel(const server::amqp &config);

    void publish(const nlohmann::json &message) override;

private:
    server::rabbitmq mq;
};

}  // namespace grader
