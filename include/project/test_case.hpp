#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一个测试点
 * 测试数据来自 lab_io.txt，评测时通过 record 记录选手程序的实际运行结果
 */
struct test_case {
    /**
     * @brief 测试点的名字，测试数据文件中的 [key]
     */
    std::string key;

    /**
     * @brief 选手程序的命令行参数
     */
    std::vector<std::string> input;

    /**
     * @brief 标准输出
     */
    std::string expected_output;

    /**
     * @brief 期望的返回值，若为空则不比较返回值
     */
    std::optional<int> expected_exit_code;

    std::optional<std::string> actual_output;

    std::optional<int> actual_exit_code;

    /**
     * @brief 记录选手程序的实际运行结果
     */
    void record(const std::string &output, int exit_code);

    /**
     * @brief 比较实际运行结果和期望结果
     * 比较前会把 \r\n 统一成 \n，并去掉末尾的空白字符。
     * 只有当测试点声明了 status 时才比较返回值。
     * @return 若还没有记录运行结果，返回 false
     */
    bool passed() const;
};

void to_json(nlohmann::json &j, const test_case &tc);

/**
 * @brief 按文件中的顺序排列的测试点集合
 */
struct test_case_set {
    std::vector<test_case> cases;

    /**
     * @brief 解析 lab_io.txt
     * @code
     * [case1]
     * in: 1 2
     * out: 3
     * status: 0
     * @endcode
     * 同一个测试点的多个 out: 行按顺序拼接为多行期望输出。
     * 不带 out: 的续行只能是不像 [key]、in:、out:、status: 的行，
     * 否则必须写成 out: 行
     * @throw assembly_error 若格式不正确，或者测试点的名字重复
     */
    static test_case_set parse(const std::string &content);

    /**
     * @brief 所有测试点都已经记录了运行结果，并且都通过
     */
    bool all_passed() const;

    bool empty() const;
    std::size_t size() const;
};

void to_json(nlohmann::json &j, const test_case_set &set);

}  // namespace grader
