#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 工程文件模板中语言列表的占位符
 */
extern const char *LANGUAGE_PLACEHOLDER;

/**
 * @brief 工程文件模板中程序入口的占位符
 */
extern const char *MAIN_PLACEHOLDER;

/**
 * @brief 工程文件，由模板填入语言列表和程序入口后生成
 */
struct manifest {
    explicit manifest(const std::string &template_content);

    /**
     * @brief 将 --LANGUAGE_PLACEHOLDER-- 替换为 for Languages use ("Ada", "C");
     * @param languages 语言在工程文件中的名字，按顺序写入
     */
    void insert_languages(const std::vector<std::string> &languages);

    /**
     * @brief 将 --MAIN_PLACEHOLDER-- 替换为 for Main use ("main");
     * @param mains 程序入口的名字（不包含扩展名）
     */
    void define_mains(const std::vector<std::string> &mains);

    const std::string &content() const;

private:
    std::string text;
};

}  // namespace grader
