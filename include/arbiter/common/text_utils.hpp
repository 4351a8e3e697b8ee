#pragma once

#include <string>

namespace arbiter {

/**
 * @brief 规范化程序输出，用于默认比较
 * 将 CRLF 替换为 LF，并删除末尾的空白字符
 */
std::string normalize_output(const std::string &text);

/**
 * @brief 解码测试数据文本
 * 通过 SQL 种子数据录入的测试数据不包含真正的换行符，而是转义后的 "\n"、"\r"、"\t"
 * （甚至是二次转义的 "\\n"），需要还原成真正的控制字符。
 * 若文本中已经包含换行符，说明是通过表单录入的，原样返回。
 */
std::string decode_testcase_text(const std::string &text);

}  // namespace arbiter
