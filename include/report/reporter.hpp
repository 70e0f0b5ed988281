#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "report/channel.hpp"

namespace grader {

/**
 * @brief 消息的类型
 */
enum class message_type {
    /**
     * @brief 评测后端执行的命令，展示在控制台中
     */
    CONSOLE = 0,

    /**
     * @brief 命令的一行标准输出
     */
    STDOUT = 1,

    /**
     * @brief 命令的一行标准错误输出
     */
    STDERR = 2,

    /**
     * @brief 评分结果
     */
    LAB = 3,

    /**
     * @brief 评测后端内部错误
     */
    INTERNAL_ERROR = 4
};

const char *get_message_type_name(message_type type);

/**
 * @brief 将消息绑定到一个任务和测试点上，再通过 channel 发布
 * 消息格式：{"task_id": ..., "lab_ref": ..., "type": ..., "data": ...}
 * 若没有测试点则不包含 lab_ref。
 */
struct reporter {
    reporter(channel &chan, const std::string &task_id, const std::optional<std::string> &lab_ref = std::nullopt);

    /**
     * @brief 返回一个发布到同一个通道、同一个任务，但属于另一个测试点的 reporter
     */
    reporter with_lab_ref(const std::optional<std::string> &lab_ref) const;

    void console(const std::string &command);
    void out(const std::string &line);
    void err(const std::string &line);

    /**
     * @brief 发布评分结果
     * @param success 是否所有测试点都通过
     * @param cases 每个测试点的评测结果
     */
    void lab(bool success, const nlohmann::json &cases);

    void internal_error(const std::string &message);

    const std::string &task_id() const;
    const std::optional<std::string> &lab_ref() const;

private:
    void send(message_type type, const nlohmann::json &data);

    channel *chan;
    std::string task;
    std::optional<std::string> lab_ref_;
};

}  // namespace grader
