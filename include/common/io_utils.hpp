#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 覆盖写入文件
 * @param path 文件路径，所在的文件夹必须存在
 * @param content 写入的内容，按字节原样写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言文件名是一个单纯的文件名，不包含任何目录
 * 选手上传的文件会被直接推送到工作目录下，如果文件名包含 "/" 或者
 * 为 ".."，那么推送时就可能覆盖工作目录以外的文件。
 * @param name 被检查的文件名
 * @return 原样返回 name
 */
std::string assert_safe_path(const std::string &name);

/**
 * @brief 判断文件名是否是一个单纯的文件名
 */
bool is_safe_path(const std::string &name);

/**
 * @brief 在系统临时文件夹下创建一个名字唯一的文件夹
 * 通过 mkdtemp 实现，文件夹名可以用来作为远程工作目录名
 * @param prefix 文件夹名前缀
 * @return 创建好的文件夹路径
 */
std::filesystem::path make_temp_directory(const std::string &prefix);

}  // namespace grader
