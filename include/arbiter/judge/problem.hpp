#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/judge/language.hpp"

/**
 * 这个头文件包含题目信息
 * 包含：
 * 1. problem 类（表示一道题目的评测配置）
 * 2. testcase_group 类（表示一个测试点分组）
 * 3. testcase 类（表示一个测试点）
 * 4. checker 类（表示题目的比较器）
 */
namespace arbiter {

/**
 * @brief 题目的评测方式
 */
enum class judge_type {
    /**
     * @brief 忽略行末 CR 和末尾空白字符后精确比较
     */
    DEFAULT,

    /**
     * @brief 使用出题人提供的比较器判定
     */
    CUSTOM
};

/**
 * @brief 表示一个测试点分组
 * 只有分组内所有测试点都通过时才能拿到该分组的分数
 */
struct testcase_group {
    std::int64_t id = 0;

    int points = 0;
};

/**
 * @brief 表示一道题目的评测配置，评测过程中不会修改
 */
struct problem {
    std::int64_t id = 0;

    /**
     * @brief 时间限制（毫秒）
     * 为空或者为 0 时使用语言的默认时间限制
     */
    std::optional<int> time_limit_ms;

    /**
     * @brief 内存限制（KB）
     * 为空时使用语言的默认内存限制，都为空时不限制内存
     */
    std::optional<int> memory_limit_kb;

    arbiter::judge_type judge_type = arbiter::judge_type::DEFAULT;

    /**
     * @brief 比较器的语言，仅当 judge_type 为 CUSTOM 时有效
     */
    std::optional<std::string> checker_language_key;

    /**
     * @brief 比较器的源代码，仅当 judge_type 为 CUSTOM 时有效
     */
    std::optional<std::string> checker_source;

    /**
     * @brief 题目总分
     * 若所有测试点都不属于任何分组，那么通过所有测试点即可拿到总分
     */
    int points = 0;

    std::vector<testcase_group> groups;

    /**
     * @brief 计算运行选手程序时使用的时间限制
     * 依次尝试题目的时间限制、语言的默认时间限制、DEFAULT_TIME_LIMIT
     */
    std::chrono::milliseconds effective_time_limit(const language &lang) const;

    /**
     * @brief 计算运行选手程序时使用的内存限制（KB）
     * @return 内存限制，nullopt 表示不限制
     */
    std::optional<long> effective_memory_limit(const language &lang) const;

    /**
     * @brief 查找分组的分数，不存在的分组为 0 分
     */
    int group_points(std::int64_t group_id) const;
};

/**
 * @brief 表示一个测试点
 */
struct testcase {
    std::int64_t id = 0;

    /**
     * @brief 测试点的显示名称
     */
    std::string name;

    /**
     * @brief 输入数据
     * 可能是转义后的文本，参见 decode_testcase_text
     */
    std::string input;

    /**
     * @brief 标准输出
     * 使用比较器评测时可以为空，此时比较器只依赖输入数据和选手输出判定
     */
    std::string expected_output;

    /**
     * @brief 所属分组，不属于任何分组时为 nullopt
     */
    std::optional<std::int64_t> group_id;

    /**
     * @brief 测试点的排序依据，评测时按照 (sort_order, id) 顺序评测
     */
    int sort_order = 0;
};

/**
 * @brief 题目的比较器
 */
struct checker {
    arbiter::language language;

    std::string source_code;
};

const char *get_judge_type_name(judge_type type);

void from_json(const nlohmann::json &j, testcase_group &group);
void from_json(const nlohmann::json &j, problem &prob);
void from_json(const nlohmann::json &j, testcase &kase);

/**
 * @brief 按照 (sort_order, id) 对测试点排序
 */
void sort_testcases(std::vector<testcase> &testcases);

}  // namespace arbiter
