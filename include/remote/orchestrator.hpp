#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "project/project.hpp"
#include "remote/execution_context.hpp"
#include "report/reporter.hpp"

namespace grader {

/**
 * @brief 执行环境中为项目创建的工作目录
 */
struct remote_workspace {
    /**
     * @brief 工作目录的唯一名字，取本地临时文件夹的文件夹名
     */
    std::string id;

    /**
     * @brief 执行环境中的工作目录路径，为 workspace_dir/id
     */
    std::filesystem::path remote_path;

    /**
     * @brief 本地临时文件夹，用来保证 id 的唯一性
     */
    std::filesystem::path local_path;
};

/**
 * @brief 运行选手程序的结果
 */
struct run_result {
    int exit_code;

    /**
     * @brief 选手程序的完整标准输出
     */
    std::string out;
};

/**
 * @brief 管理项目在执行环境中的工作目录，并在其中构建、运行、证明项目
 * 状态机：UNSTAGED -stage-> STAGED -destroy-> DESTROYED。
 * build/run/prove 只能在 STAGED 状态下调用。
 * 析构时若还没有 destroy，会自动 destroy，保证工作目录一定会被删除。
 */
struct remote_orchestrator {
    enum class state {
        UNSTAGED,
        STAGED,
        DESTROYED
    };

    remote_orchestrator(const project &proj, const project_config &config, execution_context &context, reporter &rep);
    remote_orchestrator(const remote_orchestrator &) = delete;
    remote_orchestrator &operator=(const remote_orchestrator &) = delete;
    ~remote_orchestrator();

    /**
     * @brief 创建工作目录，并将项目的所有文件推送到工作目录中
     * 推送失败时，对象仍然可以 destroy
     * @throw internal_error 若不是 UNSTAGED 状态
     * @throw execution_error 若执行环境出错
     */
    const remote_workspace &stage();

    /**
     * @brief 构建项目
     * @return 构建命令的返回值，总是 0
     * @throw build_error 若构建命令返回了非零的返回值
     */
    int build();

    /**
     * @brief 运行选手程序
     * 选手程序通过 sudo 以低权限用户运行，并受到 timeout 的时间限制。
     * 超时（返回值 124）不是错误，只会在控制台中提示。
     * @param cli_args 命令行参数，若为空则使用 cli.txt 中的参数
     * @param lab_ref 测试点名，输出会被标记为属于该测试点
     * @throw run_error 若项目没有程序入口
     */
    run_result run(const std::optional<std::vector<std::string>> &cli_args = std::nullopt,
                   const std::optional<std::string> &lab_ref = std::nullopt);

    /**
     * @brief 对项目进行形式化验证
     * @param extra_args 追加给证明工具的参数，比如 --mode=flow
     * @return 证明工具的返回值，非零不是错误
     * @throw prove_error 若项目不是形式化验证模式
     */
    int prove(const std::vector<std::string> &extra_args);

    /**
     * @brief 删除工作目录，重复调用不会有任何效果
     * @throw execution_error 若执行环境删除工作目录失败
     */
    void destroy();

    state current_state() const;

    const project &get_project() const;

    /**
     * @brief 工作目录，只有 stage 之后才有值
     */
    const std::optional<remote_workspace> &workspace() const;

    reporter &get_reporter();

private:
    void require_staged(const char *operation) const;

    const project &proj;
    const project_config &config;
    execution_context &context;
    reporter &rep;
    state st = state::UNSTAGED;
    std::optional<remote_workspace> ws;
};

const char *get_state_name(remote_orchestrator::state st);

}  // namespace grader
