#pragma once

#include "remote/execution_context.hpp"

namespace grader {

/**
 * @brief 直接使用本机的文件系统和进程的执行环境
 * 适用于评测后端本身就运行在沙箱容器中的情况，以及测试
 */
struct local_context : public execution_context {
    void mkdir(const std::filesystem::path &path) override;
    void push_files(const std::vector<source_file> &files, const std::filesystem::path &path) override;
    void rmdir(const std::filesystem::path &path) override;
    execution_result execute(const std::vector<std::string> &argv, reporter &rep, bool inherit_env) override;
};

}  // namespace grader
