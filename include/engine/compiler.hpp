#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "config.hpp"
#include "engine/model.hpp"

namespace grader {

/**
 * @brief 编译引擎
 * 在沙箱内以受限的环境变量、头文件路径、时间和内存限制调用编译器，
 * 只编译（-c）不链接，并把编译器输出解析为结构化的诊断信息。
 */
struct compiler {
    /**
     * @param toolchain 编译器及资源限制
     * @param sandbox_root 源文件和输出目录都必须位于此目录之内
     * @param include_dirs 允许被包含的头文件目录，除此之外只有源文件所在目录
     * @param max_file_size 源文件大小上限
     */
    compiler(const toolchain_config &toolchain, std::filesystem::path sandbox_root,
             std::vector<std::filesystem::path> include_dirs, size_t max_file_size);

    /**
     * @brief 编译一个源文件
     * 这个函数不会抛出异常：所有错误（文件不存在、路径不合法、无法启动编译器、
     * 编译超时）都会变成 success = false 和一条合成的诊断信息。
     * 编译成功时在 output_dir 中递归查找 <stem>.o 作为编译产物，找不到时 artifact 为空。
     * @param unit 已经写入沙箱的源文件，path 必须非空
     * @param output_dir 编译产物的输出目录
     * @param cancel 取消标记，可以为空
     */
    compilation_outcome compile(const submission_unit &unit, const std::filesystem::path &output_dir,
                                const cancellation_token *cancel = nullptr) const;

private:
    toolchain_config toolchain;
    std::filesystem::path sandbox_root;
    std::vector<std::filesystem::path> include_dirs;
    size_t max_file_size;
};

/**
 * @brief 解析 GCC 格式的编译器输出
 * 识别以下几种形式的行，其他行（源码摘录、"In file included from" 等）被忽略：
 * file:line:column: {error|fatal error|warning|note}: message
 * file:line: {error|fatal error|warning|note}: message
 * tool: {error|fatal error|warning|note}: message
 * @return 按输出顺序排列的诊断信息
 */
std::vector<diagnostic> parse_diagnostics(const std::string &output);

/**
 * @brief 在目录中递归查找指定文件名的文件
 * @return 找到的第一个文件，找不到时返回空路径
 */
std::filesystem::path find_artifact(const std::filesystem::path &dir, const std::string &filename);

}  // namespace grader
