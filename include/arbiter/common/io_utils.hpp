#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 若文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def);

/**
 * @brief 将 content 写入文件，若文件已存在则覆盖
 * @throw std::system_error 若文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 源文件的文件名由语言配置的扩展名拼接而成，确保扩展名不会让文件写到工作区外面
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 在 dir 下生成一个不存在的随机文件名
 * @param prefix 文件名前缀
 * @param suffix 文件名后缀
 */
std::filesystem::path unique_path(const std::filesystem::path &dir, const std::string &prefix, const std::string &suffix = "");

}  // namespace arbiter
