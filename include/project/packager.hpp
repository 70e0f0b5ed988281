#pragma once

#include <string>
#include "project/project.hpp"

namespace grader {

/**
 * @brief 将项目的所有文件打包成 zip 压缩包
 * 文件按 project.files 的顺序存放在压缩包根目录下，使用 deflate 压缩。
 * 所有文件的修改时间固定为 1980-01-01 00:00，权限固定为 0644，
 * 因此相同的项目总会得到完全相同的压缩包。
 * @param proj 要打包的项目
 * @return 压缩包的二进制内容
 * @throw internal_error 若 libzip 报错
 */
std::string zip(const project &proj);

}  // namespace grader
