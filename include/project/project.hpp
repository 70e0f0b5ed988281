#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "project/source_file.hpp"
#include "project/test_case.hpp"

namespace grader {

/**
 * @brief 选手上传的一个文件
 */
struct uploaded_file {
    /**
     * @brief 文件名，必须是不包含目录的单纯文件名
     */
    std::string name;

    std::string content;
};

/**
 * @brief 一个可以构建的项目
 * 由 project_assembler 构造，构造完成后不再修改。
 * files 的最后两个文件分别是生成的工程文件和编译限制文件。
 */
struct project {
    std::vector<source_file> files;

    /**
     * @brief 程序入口的名字（不包含扩展名），若项目没有程序入口则为空
     */
    std::optional<std::string> entry_point;

    /**
     * @brief 来自 cli.txt 的命令行参数，若没有上传 cli.txt 则为空
     */
    std::optional<std::vector<std::string>> cli_args;

    /**
     * @brief 是否为形式化验证模式
     */
    bool verification_mode = false;

    /**
     * @brief 来自 lab_io.txt 的测试数据，若没有上传 lab_io.txt 则为空
     */
    std::optional<test_case_set> test_cases;

    /**
     * @brief 工程文件的文件名，比如 main.gpr
     */
    std::string manifest_name;
};

/**
 * @brief 从选手上传的文件构造项目
 */
struct project_assembler {
    explicit project_assembler(const project_config &config);

    /**
     * @brief 构造项目
     * 1. 取出 cli.txt 和 lab_io.txt 两个保留文件，其余文件作为源文件；
     * 2. 按 Ada、C、C++ 的顺序把用到的语言写入工程文件；
     * 3. 查找程序入口并写入工程文件；
     * 4. 追加工程文件和编译限制文件。
     * @param files 选手上传的文件
     * @param verification_mode 是否为形式化验证模式，该模式下编译限制文件会追加验证相关的配置
     * @throw assembly_error 若存在多个程序入口、文件名不合法或者测试数据格式错误
     */
    project assemble(const std::vector<uploaded_file> &files, bool verification_mode) const;

    /**
     * @brief 生成编译限制文件的内容
     */
    std::string restrictions(bool verification_mode) const;

private:
    const project_config &config;
};

}  // namespace grader
