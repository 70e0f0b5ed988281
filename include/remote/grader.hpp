#pragma once

#include "project/test_case.hpp"
#include "remote/orchestrator.hpp"

namespace grader {

/**
 * @brief 评分结果
 */
struct submission_result {
    /**
     * @brief 是否所有测试点都通过
     */
    bool success;

    /**
     * @brief 记录了运行结果的测试点
     */
    test_case_set cases;
};

/**
 * @brief 按测试数据的顺序逐个运行测试点并评分，最后发布一条 lab 消息
 * 项目本身不会被修改，运行结果记录在测试数据的副本上。
 * 某个测试点运行时抛出的异常不会被捕获，评分直接中止，也不会发布部分结果：
 * 执行环境的错误不能被当作选手程序的错误。
 * @param orchestrator 已经 stage 并且 build 过的项目
 * @throw submit_error 若项目没有程序入口或者没有测试数据
 */
submission_result submit(remote_orchestrator &orchestrator);

}  // namespace grader
