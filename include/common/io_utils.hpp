#pragma once

#include <sys/types.h>
#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 以给定权限创建并写入文件
 * 文件已存在时会被截断。权限在创建时就已设置好，不存在权限过宽的窗口期。
 * @param path 文件路径，父目录必须存在
 * @param content 文件内容
 * @param mode 新文件的权限，默认只有所有者可读写
 */
void write_file_content(const std::filesystem::path &path, const std::string &content, mode_t mode = 0600);

/**
 * @brief 判断 path 是否位于 root 之内
 * 两者都会被规范化（解析 "."、".." 以及已存在部分的符号链接）后再逐段比较，
 * 因此 "root/../root2" 和指向外部的符号链接都不会被认为在 root 之内。
 * path 等于 root 本身时返回 false。
 */
bool is_subpath(const std::filesystem::path &path, const std::filesystem::path &root);

/**
 * @brief 创建目录（包括父目录），并将最后一级目录的权限设置为 mode
 */
void create_private_directory(const std::filesystem::path &dir, std::filesystem::perms mode = std::filesystem::perms::owner_all);

}  // namespace grader
