#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "arbiter/common/status.hpp"

namespace arbiter {

/**
 * @brief 一个测试点的评测结果
 * 评测完每个测试点后都会通过 on_result 回调传给调用方
 */
struct testcase_result {
    std::int64_t testcase_id = 0;

    std::string name;

    arbiter::status status = arbiter::status::SYSTEM_ERROR;

    /**
     * @brief 运行时间（毫秒）
     */
    std::optional<long> time_ms;

    /**
     * @brief 峰值内存（KB），内存统计不可用时为 nullopt
     */
    std::optional<long> memory_kb;

    std::optional<std::string> output;

    std::optional<std::string> error;
};

/**
 * @brief 整个提交的评测结果
 */
struct judge_report {
    /**
     * @brief 第一个不是 ACCEPTED 的测试点结果，所有测试点都通过时为 ACCEPTED
     */
    status verdict = status::ACCEPTED;

    /**
     * @brief 编译信息
     * 编译失败时为编译器输出；比较器出错时为比较器的诊断信息；
     * 评测系统出错时为异常信息
     */
    std::optional<std::string> compile_output;

    /**
     * @brief 按照评测顺序排列的测试点结果，编译失败时为空
     */
    std::vector<testcase_result> results;

    int score = 0;

    std::optional<long> max_time_ms;

    std::optional<long> max_memory_kb;
};

/**
 * @brief 自定义输入运行的结果
 */
struct run_report {
    /**
     * @brief 运行结果，正常结束时为 RAN
     */
    arbiter::status status = arbiter::status::RAN;

    std::optional<std::string> compile_output;

    std::optional<long> time_ms;

    std::optional<long> memory_kb;

    std::optional<std::string> output;

    std::optional<std::string> error;
};

/**
 * @brief 构造评测系统出错时的评测结果
 * @param message 异常信息，保存在 compile_output 中
 */
judge_report make_system_error_report(const std::string &message);

void to_json(nlohmann::json &j, const testcase_result &result);
void to_json(nlohmann::json &j, const judge_report &report);
void to_json(nlohmann::json &j, const run_report &report);

}  // namespace arbiter
