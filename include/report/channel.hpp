#pragma once

#include <nlohmann/json.hpp>

namespace grader {

/**
 * @brief 评测进度和结果的发布通道
 * 每条消息都是一个 JSON 对象，由 reporter 构造
 */
struct channel {
    virtual ~channel();

    /**
     * @brief 发布一条消息
     * @throw 发布失败时由具体的实现抛出异常
     */
    virtual void publish(const nlohmann::json &message) = 0;
};

}  // namespace grader
