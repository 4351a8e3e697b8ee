#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include "arbiter/common/status.hpp"

/**
 * 比较器输出的解析
 * 比较器通过 stdout 输出判定结果，支持以下几种形式：
 * 1. JSON 布尔值：true 表示通过，false 表示答案错误
 * 2. JSON 字符串：字符串的内容会被重新解析，比如 "\"AC\"" 或者 "\"{\\\"status\\\": true}\""
 * 3. JSON 对象：依次读取 status、result、verdict 字段，字段值按照 1、2 解析
 * 4. 其他文本：忽略大小写与词表匹配
 *    accepted, ac, ok, pass, passed, true 表示通过
 *    wrong answer, wrong, wa, fail, failed, false 表示答案错误
 */
namespace arbiter {

/**
 * @brief JSON 对象形式的比较器输出
 */
struct checker_object_reply {
    nlohmann::json fields;
};

/**
 * @brief 无法解析为 JSON 的比较器输出，按照词表匹配
 */
struct checker_text_reply {
    std::string text;
};

/**
 * @brief 比较器输出的几种形式
 * std::string 表示 JSON 字符串，其内容需要被重新解析
 */
using checker_reply = std::variant<bool, std::string, checker_object_reply, checker_text_reply>;

/**
 * @brief 将比较器的 stdout 分类
 * @return 比较器输出的形式，若输出为空返回 nullopt
 */
std::optional<checker_reply> classify_checker_reply(const std::string &output);

/**
 * @brief 根据比较器输出的形式得到判定结果
 * @return ACCEPTED 或者 WRONG_ANSWER，若无法识别返回 nullopt
 */
std::optional<status> resolve_checker_reply(const checker_reply &reply);

/**
 * @brief 解析比较器的 stdout
 * @return ACCEPTED 或者 WRONG_ANSWER，若输出为空或者无法识别返回 nullopt
 */
std::optional<status> parse_checker_verdict(const std::string &output);

}  // namespace arbiter
