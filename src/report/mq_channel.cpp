#include "report/mq_channel.hpp"

namespace grader {
using namespace std;

mq_channel::mq_channel(const server::amqp &config) : mq(config) {}

void mq_channel::publish(const nlohmann::json &message) {
    mq.report(message.dump());
}

}  // namespace grader
