#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "arbiter/judge/command.hpp"

namespace arbiter {

/**
 * @brief 描述一种编程语言如何编译和运行
 * 由配置文件提供，评测过程中只读
 */
struct language {
    /**
     * @brief 语言的唯一标识，比如 cpp17, python3
     */
    std::string key;

    /**
     * @brief 显示名称，比如 C++17 (g++)
     */
    std::string name;

    std::string version;

    /**
     * @brief 源代码文件的扩展名，不包含点，比如 cpp
     * 选手代码将保存为 Main.<source_ext>，比较器代码保存为 Checker.<source_ext>
     */
    std::string source_ext;

    /**
     * @brief 编译命令模板，解释型语言为 nullopt
     */
    std::optional<command_template> compile_command;

    /**
     * @brief 运行命令模板
     * 数据库中此项必填，但配置错误时为 nullopt，此时运行将返回 System Error
     */
    std::optional<command_template> run_command;

    bool interpreted = false;

    /**
     * @brief 题目没有设置时间限制时使用的时间限制（毫秒）
     */
    std::optional<int> default_time_limit_ms;

    /**
     * @brief 题目没有设置内存限制时使用的内存限制（KB）
     */
    std::optional<int> default_memory_limit_kb;
};

void from_json(const nlohmann::json &j, language &lang);
void to_json(nlohmann::json &j, const language &lang);

/**
 * @brief 语言配置表
 * 在评测系统启动时从配置文件加载，之后只读，可以被多个 worker 并发访问
 */
struct language_registry {
    /**
     * @brief 从 JSON 配置文件加载语言
     * 配置文件可以是语言数组，也可以是 {"languages": [...]}
     * @throw config_error 若文件无法读取或者格式错误
     */
    void load(const std::filesystem::path &config_path);

    void add(language lang);

    /**
     * @brief 根据 key 查找语言
     * @return 语言，若不存在返回 nullptr
     */
    const language *find(const std::string &key) const;

    /**
     * @throw config_error 若不存在该语言
     */
    const language &at(const std::string &key) const;

    std::size_t size() const;

private:
    std::map<std::string, language> languages;
};

}  // namespace arbiter
