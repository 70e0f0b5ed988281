#pragma once

#include <ostream>
#include "report/channel.hpp"

namespace grader {

/**
 * @brief 将消息按行写入输出流，每行一个 JSON 对象
 * 没有配置消息队列时，grader-worker 通过它把消息写到标准输出
 */
struct stream_channel : public channel {
    explicit stream_channel(std::ostream &os);

    void publish(const nlohmann::json &message) override;

private:
    std::ostream &os;
};

}  // namespace grader
