#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 语言的编译命令和运行命令模板
 * 模板是一个参数数组，每个参数中可以包含占位符：
 * {src}: 源代码路径
 * {exe}: 编译产生的可执行文件路径
 * {workdir}: 工作区路径
 * 比如 C++ 的编译命令：["g++", "-std=c++17", "-O2", "{src}", "-o", "{exe}"]
 */
namespace arbiter {

using command_template = std::vector<std::string>;

/**
 * @brief 一次运行中占位符对应的路径
 */
struct command_paths {
    std::filesystem::path src;
    std::filesystem::path exe;
    std::filesystem::path workdir;

    std::map<std::string, std::string> substitutions() const;
};

/**
 * @brief 从语言配置中解析命令模板
 * 数据库中的命令可能是 JSON 数组，也可能是编码成字符串的 JSON 数组。
 * @param value 命令模板，可以是字符串数组、JSON 字符串或者 null
 * @return 命令模板，若 value 为 null、JSON 格式错误或者不是字符串数组，返回 nullopt
 */
std::optional<command_template> parse_command_template(const nlohmann::json &value);

/**
 * @brief 替换模板中的所有占位符
 * 未知的占位符会被替换为空字符串
 * @param tmpl 命令模板，nullopt 表示该语言没有配置此命令
 * @param substitutions 占位符名到值的映射
 * @return 具体的命令行参数（argv[0] 为程序），若模板不存在或者为空数组返回 nullopt
 */
std::optional<std::vector<std::string>> resolve_command(const std::optional<command_template> &tmpl, const std::map<std::string, std::string> &substitutions);

std::optional<std::vector<std::string>> resolve_command(const std::optional<command_template> &tmpl, const command_paths &paths);

}  // namespace arbiter
