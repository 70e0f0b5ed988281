#pragma once

#include <string>
#include <vector>
#include "config.hpp"
#include "project/project.hpp"
#include "remote/execution_context.hpp"
#include "report/channel.hpp"

namespace grader {

/**
 * @brief 评测请求的模式
 */
enum class run_mode {
    /**
     * @brief 构建并运行
     */
    RUN,

    /**
     * @brief 构建并按测试数据评分
     */
    SUBMIT,

    PROVE,
    PROVE_FLOW,
    PROVE_REPORT_ALL,
    PROVE_FLOW_REPORT_ALL
};

/**
 * @brief 解析模式名，比如 "prove_flow"
 * @throw std::invalid_argument 若模式名不存在
 */
run_mode parse_run_mode(const std::string &name);

const char *get_run_mode_name(run_mode mode);

/**
 * @brief 该模式是否需要形式化验证
 */
bool is_prove_mode(run_mode mode);

/**
 * @brief 该模式追加给证明工具的参数
 */
std::vector<std::string> prove_arguments(run_mode mode);

/**
 * @brief 一个评测请求
 */
struct request {
    std::string task_id;
    run_mode mode;
    std::vector<uploaded_file> files;
};

/**
 * @brief 处理评测请求：构造项目，创建工作目录，按模式构建、运行、证明或评分，最后删除工作目录
 * 项目错误会发布到 chan 并返回非零值；执行环境的错误会以 internal_error 消息发布后重新抛出。
 * @return 0 表示成功；run 模式返回选手程序的返回值；prove 模式返回证明工具的返回值；
 * submit 模式在有测试点未通过时返回 1
 */
int process_request(const request &req, const project_config &config, execution_context &context, channel &chan);

}  // namespace grader
