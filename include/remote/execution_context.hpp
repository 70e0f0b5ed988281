#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "project/source_file.hpp"
#include "report/reporter.hpp"

namespace grader {

/**
 * @brief 在执行环境中执行命令的结果
 */
struct execution_result {
    int exit_code = -1;
    std::string out;
    std::string err;
};

/**
 * @brief 隔离的执行环境（沙箱）
 * 评测后端只通过这几个操作访问执行环境，执行环境的创建、隔离由外部负责。
 * 传输错误应该以 execution_error 的形式抛出。
 */
struct execution_context {
    virtual ~execution_context();

    /**
     * @brief 在执行环境中创建文件夹
     */
    virtual void mkdir(const std::filesystem::path &path) = 0;

    /**
     * @brief 将文件推送到执行环境的文件夹中
     * @param files 要推送的文件，文件名是不包含目录的单纯文件名
     * @param path 执行环境中的目标文件夹，必须已经存在
     */
    virtual void push_files(const std::vector<source_file> &files, const std::filesystem::path &path) = 0;

    /**
     * @brief 删除执行环境中的文件夹及其中的所有文件
     * 若文件夹不存在，什么也不做
     */
    virtual void rmdir(const std::filesystem::path &path) = 0;

    /**
     * @brief 在执行环境中执行命令
     * 命令的每一行标准输出和标准错误输出都会实时通过 rep 发布
     * @param argv 命令行
     * @param rep 发布输出的 reporter
     * @param inherit_env 是否继承执行环境的环境变量
     * @return 命令的返回值和完整输出，非零的返回值不是错误
     */
    virtual execution_result execute(const std::vector<std::string> &argv, reporter &rep, bool inherit_env) = 0;
};

}  // namespace grader
