#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 按空白字符拆分字符串，连续的空白字符视为一个分隔符
 * @code{.cpp}
 *     split_arguments("  1 2\n3 ") == {"1", "2", "3"}
 * @endcode
 */
std::vector<std::string> split_arguments(const std::string &text);

/**
 * @brief 将参数转义成 bash 的单引号字符串
 * 转义后的参数可以安全地拼接进 bash -c 的命令行，不会发生命令注入
 * @code{.cpp}
 *     shell_quote("it's") == "'it'\\''s'"
 * @endcode
 */
std::string shell_quote(const std::string &arg);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
