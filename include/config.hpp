#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace grader {

enum error_codes {
    E_SUCCESS = 0,

    /**
     * @brief timeout 命令在程序超时被杀死后的返回值
     */
    E_TIMEOUT = 124,

    /**
     * @brief 命令无法执行（比如找不到可执行文件）
     */
    E_EXEC_FAILED = 127
};

/**
 * @brief 默认的编译限制，所有项目都需要遵守
 * 禁止选手通过 Import/Interface 和机器码绕过评测环境
 */
extern const char *BASELINE_RESTRICTIONS;

/**
 * @brief 形式化验证模式下追加的编译限制
 */
extern const char *VERIFICATION_RESTRICTIONS;

/**
 * @brief 构造项目、远程构建运行时使用的配置
 * 所有的配置项都有默认值，配置文件中可以只写需要修改的项
 */
struct project_config {
    /**
     * @brief 构建工具的路径
     */
    std::string build_tool_path = "gprbuild";

    /**
     * @brief 证明工具的路径
     */
    std::string prover_path = "gnatprove";

    /**
     * @brief 工程文件模板的路径
     * 模板的文件名就是生成的工程文件名
     */
    std::filesystem::path manifest_template_path = "templates/main.gpr";

    /**
     * @brief 工程文件模板的内容，通过 load_project_config 从 manifest_template_path 读入
     */
    std::string manifest_template;

    std::string baseline_restrictions = BASELINE_RESTRICTIONS;

    std::string verification_restrictions = VERIFICATION_RESTRICTIONS;

    /**
     * @brief 选手程序运行时限，单位为秒
     */
    int run_timeout_seconds = 10;

    /**
     * @brief 选手程序运行时通过 LD_PRELOAD 预加载的库
     */
    std::string preload_library_path = "/preloader.so";

    /**
     * @brief 运行选手程序的低权限用户
     */
    std::string run_user = "unprivileged";

    /**
     * @brief 执行环境中存放工作目录的文件夹
     * 每个项目在这个文件夹下有一个唯一的工作目录
     */
    std::filesystem::path workspace_dir = "/workspace/sessions";

    /**
     * @brief 保留文件名：命令行参数文件
     */
    std::string cli_file_name = "cli.txt";

    /**
     * @brief 保留文件名：测试数据文件
     */
    std::string lab_file_name = "lab_io.txt";

    /**
     * @brief 生成的编译限制文件的文件名
     */
    std::string restrictions_file_name = "main.adc";

    /**
     * @brief 生成的工程文件的文件名
     */
    std::string manifest_file_name() const;
};

void from_json(const nlohmann::json &j, project_config &config);

/**
 * @brief 读取配置文件，并读入工程文件模板
 * 配置文件中的相对路径相对于配置文件所在的文件夹
 * @param config_path 配置文件路径
 * @return 配置
 */
project_config load_project_config(const std::filesystem::path &config_path);

/**
 * @brief 读入 config.manifest_template_path 指向的工程文件模板
 */
void load_manifest_template(project_config &config);

}  // namespace grader
