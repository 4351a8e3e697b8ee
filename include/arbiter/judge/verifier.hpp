#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "arbiter/common/status.hpp"
#include "arbiter/judge/command.hpp"
#include "arbiter/judge/executor.hpp"
#include "arbiter/judge/language.hpp"
#include "arbiter/judge/memory_probe.hpp"

namespace arbiter {

/**
 * @brief 比较选手输出之后的结果
 */
struct verification {
    /**
     * @brief ACCEPTED、WRONG_ANSWER 或者 SYSTEM_ERROR（比较器出错）
     */
    arbiter::status status;

    /**
     * @brief 测试点结果中显示的错误信息
     * 比较器出错时为比较器的诊断信息，否则为选手程序的 stderr
     */
    std::optional<std::string> error;
};

/**
 * @brief 判定选手程序在一个测试点上的输出是否正确
 * 只有选手程序运行结果为 OK 时才会调用
 */
struct verifier {
    virtual ~verifier();

    /**
     * @param input 已解码的输入数据
     * @param expected_output 已解码的标准输出，使用比较器时可以为空
     * @param result 选手程序的运行结果
     */
    virtual verification verify(const std::string &input, const std::string &expected_output, const execution_result &result) = 0;
};

/**
 * @brief 默认比较方式
 * 选手输出和标准输出都将 CRLF 替换为 LF 并删除末尾空白字符后，完全一致即为通过
 */
struct diff_verifier : public verifier {
    verification verify(const std::string &input, const std::string &expected_output, const execution_result &result) override;
};

/**
 * @brief 使用出题人提供的比较器判定
 * 比较器的 stdin 为 JSON：{"input": ..., "expectedOutput": ..., "output": ...}，
 * stdout 为判定结果，参见 parse_checker_verdict。
 * 比较器运行失败或者输出无法识别时，测试点结果为 SYSTEM_ERROR，不会判定选手答案错误。
 */
struct checker_verifier : public verifier {
    /**
     * @param lang 比较器的语言
     * @param paths 已经编译好的比较器的路径
     * @param time_limit 比较器的时间限制
     * @param memory_limit_kb 比较器的内存限制
     * @param probe 内存统计
     */
    checker_verifier(const language &lang, command_paths paths, std::chrono::milliseconds time_limit, std::optional<long> memory_limit_kb, const memory_probe &probe);

    verification verify(const std::string &input, const std::string &expected_output, const execution_result &result) override;

private:
    const language &lang;
    command_paths paths;
    std::chrono::milliseconds time_limit;
    std::optional<long> memory_limit_kb;
    const memory_probe &probe;
};

}  // namespace arbiter
