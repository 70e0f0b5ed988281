#pragma once

#include <string>

namespace grader {

/**
 * @brief 源文件的语言
 * 只区分选择工具链需要的几种，其他文件都是 UNKNOWN
 */
enum class language {
    ADA = 0,
    C = 1,
    CPP = 2,

    /**
     * @brief 不参与编译的文件，比如选手上传的说明文档
     */
    UNKNOWN = 3,

    /**
     * @brief 工程文件 (.gpr)
     */
    MANIFEST = 4,

    /**
     * @brief 编译配置文件 (.adc)
     */
    CONFIG = 5
};

/**
 * @brief 获取语言在工程文件中的名字
 * @return "Ada"、"C"、"C++"，其他语言没有名字，返回空字符串
 */
const char *get_language_name(language lang);

/**
 * @brief 判断该语言是否需要写进工程文件的 Languages 列表
 */
bool is_compiled_language(language lang);

/**
 * @brief 根据文件扩展名推断文件的语言
 * .h 文件既可能是 C 也可能是 C++，此时通过内容中是否出现 C++ 独有的语法来判断
 * @param name 文件名
 * @param content 文件内容
 */
language detect_language(const std::string &name, const std::string &content);

}  // namespace grader
