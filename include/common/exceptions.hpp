#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测后端自身的内部错误
 * 一般是调用方没有按照状态机的要求调用，或者是 libzip 等依赖库的错误
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示执行环境（沙箱）的传输错误
 * 比如创建远程目录、推送文件、执行命令失败。
 * 这类错误不会被本地恢复，需要交给调用层上报并清理工作目录
 */
struct execution_error : public grader_exception {
    execution_error();
    explicit execution_error(const std::string &message);
};

/**
 * @brief 所有和项目本身相关的错误的基类
 * 这些错误是选手提交或者调用方配置导致的，需要展示给用户
 */
struct project_error : public grader_exception {
    explicit project_error(const std::string &message);
};

/**
 * @brief 项目无法构造，比如存在多个程序入口，或者测试数据格式不正确
 */
struct assembly_error : public project_error {
    explicit assembly_error(const std::string &message);
};

/**
 * @brief 远程构建返回了非零的返回值
 * 抛出该异常以中断 build/run/prove 的调用链
 */
struct build_error : public project_error {
    explicit build_error(int code);

    int code() const;

private:
    int exit_code;
};

/**
 * @brief 项目没有程序入口，无法运行
 */
struct run_error : public project_error {
    explicit run_error(const std::string &message);
};

/**
 * @brief 项目不是形式化验证模式，无法证明
 */
struct prove_error : public project_error {
    explicit prove_error(const std::string &message);
};

/**
 * @brief 项目缺少程序入口或者测试数据，无法评分
 */
struct submit_error : public project_error {
    explicit submit_error(const std::string &message);
};

}  // namespace grader
