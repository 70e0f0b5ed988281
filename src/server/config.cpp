#include "server/config.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("hostname").get_to(mq.hostname);
    if (j.count("port"))
        j.at("port").get_to(mq.port);
    else
        mq.port = 5672;
    j.at("exchange").get_to(mq.exchange);
    if (j.count("exchange_type"))
        j.at("exchange_type").get_to(mq.exchange_type);
    else
        mq.exchange_type = "direct";
    j.at("queue").get_to(mq.queue);
    if (j.count("routing_key"))
        j.at("routing_key").get_to(mq.routing_key);
    else
        mq.routing_key = "";
}

}  // namespace grader::server
