#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 外部命令的执行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值
     * 如果外部命令因为信号崩溃而没有返回码，则为 128 + 信号编号（和 bash 一致）
     */
    int exit_code = -1;

    /**
     * @brief 外部命令的完整标准输出
     */
    std::string out;

    /**
     * @brief 外部命令的完整标准错误输出
     */
    std::string err;
};

/**
 * @brief 外部命令每输出一行时的回调，参数不包含行末的换行符
 */
typedef std::function<void(const std::string &)> line_callback;

/**
 * @brief 执行外部命令，并捕获标准输出和标准错误输出
 * 与 system(cmd) 的区别是，这个函数不经过 shell，避免了转义导致的安全问题。
 * 标准输入被重定向到 /dev/null。
 * @param argv 外部命令的路径 (argv[0]) 和 参数，argv[0] 会在 PATH 中查找
 * @param env 额外的环境变量
 * @param inherit_env 若为假，子进程只能看到 PATH 和 env 中的环境变量
 * @param on_out 每读到一行标准输出时调用，可以为空
 * @param on_err 每读到一行标准错误输出时调用，可以为空
 * @return 执行结果
 * @throw std::system_error 若无法创建管道或者 fork 失败
 */
process_result exec_program(const std::vector<std::string> &argv,
                            const std::map<std::string, std::string> &env,
                            bool inherit_env,
                            const line_callback &on_out,
                            const line_callback &on_err);

}  // namespace grader
