#pragma once

#include <string>
#include "project/language.hpp"

namespace grader {

/**
 * @brief 项目中的一个文件
 * 创建后不可修改，语言在构造时根据文件名和内容推断
 */
struct source_file {
    source_file(const std::string &name, const std::string &content);
    source_file(const std::string &name, const std::string &content, language lang);

    const std::string &name() const;
    const std::string &content() const;
    language lang() const;

    /**
     * @brief 不包含扩展名的文件名，比如 main.adb 的 stem 是 main
     */
    std::string stem() const;

    /**
     * @brief 判断该文件是否是头文件/规格说明 (.ads .h .hpp ...)
     * 头文件不可能是程序入口
     */
    bool is_header() const;

    /**
     * @brief 判断该文件是否包含程序入口
     * Ada：实现文件的第一个编译单元（跳过 with/use/pragma 等上下文子句）是无参数的 procedure X is
     * C/C++：非头文件中，在注释以外出现了 int main (
     */
    bool is_entry_point() const;

private:
    std::string file_name;
    std::string file_content;
    language file_language;
};

}  // namespace grader
