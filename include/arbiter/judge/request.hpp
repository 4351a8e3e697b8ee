#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/judge/language.hpp"
#include "arbiter/judge/problem.hpp"

namespace arbiter {

/**
 * @brief 一次评测请求
 * 请求包含评测所需的全部信息，可以被放入评测队列由其他线程评测
 */
struct judge_request {
    /**
     * @brief 提交的语言
     */
    language lang;

    problem prob;

    /**
     * @brief 按照评测顺序排列的测试点
     */
    std::vector<testcase> testcases;

    std::string source_code;

    /**
     * @brief 题目的比较器，仅当题目使用比较器评测且比较器配置完整时存在
     */
    std::optional<arbiter::checker> checker;
};

/**
 * @brief 自定义输入运行请求
 */
struct run_request {
    language lang;

    /**
     * @brief 提供时间限制和内存限制
     */
    problem prob;

    std::string source_code;

    /**
     * @brief 输入数据，可能是转义后的文本，参见 decode_testcase_text
     */
    std::string input;
};

/**
 * @brief 从 JSON 解析评测请求
 * {
 *   "language": "cpp17",
 *   "source_code": "...",
 *   "problem": {...},
 *   "testcases": [{...}, ...]
 * }
 * 测试点会按照 (sort_order, id) 排序。比较器的语言通过 problem.checker_language_key 查找。
 *
 * @param j 请求
 * @param languages 语言配置表
 * @throw config_error 若提交的语言不存在
 * @throw std::invalid_argument 若请求格式错误
 */
judge_request parse_judge_request(const nlohmann::json &j, const language_registry &languages);

/**
 * @brief 从 JSON 解析自定义输入运行请求
 * {
 *   "language": "cpp17",
 *   "source_code": "...",
 *   "input": "...",
 *   "problem": {...} // 可选
 * }
 * @throw config_error 若语言不存在
 * @throw std::invalid_argument 若请求格式错误
 */
run_request parse_run_request(const nlohmann::json &j, const language_registry &languages);

}  // namespace arbiter
