#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "arbiter/common/status.hpp"
#include "arbiter/judge/command.hpp"
#include "arbiter/judge/language.hpp"
#include "arbiter/judge/memory_probe.hpp"

namespace arbiter {

/**
 * @brief 运行一次程序（选手程序或比较器）的分类结果
 */
struct execution_result {
    /**
     * @brief 运行结果，可能为 OK、TIME_LIMIT_EXCEEDED、RUNTIME_ERROR、
     * MEMORY_LIMIT_EXCEEDED 或 SYSTEM_ERROR（没有可用的运行命令）
     */
    arbiter::status status = arbiter::status::SYSTEM_ERROR;

    /**
     * @brief 运行时间（毫秒），没有运行时为 nullopt
     */
    std::optional<long> time_ms;

    /**
     * @brief 峰值内存（KB），内存统计不可用时为 nullopt
     */
    std::optional<long> memory_kb;

    /**
     * @brief 去除首尾空白字符后的 stdout
     * 超时和运行时错误时总是保留（可能为空字符串），其他情况下空输出为 nullopt
     */
    std::optional<std::string> output;

    /**
     * @brief 未经处理的 stdout，用于与标准输出比较，保留行首的空白字符
     */
    std::string raw_output;

    /**
     * @brief 去除首尾空白字符后的 stderr，为空时为 nullopt
     */
    std::optional<std::string> error;
};

/**
 * @brief 运行一次程序的参数
 */
struct execution_request {
    const language &lang;

    /**
     * @brief 填充运行命令模板的路径，程序在 paths.workdir 下运行
     */
    command_paths paths;

    /**
     * @brief 已经解码的输入数据
     */
    std::string input;

    std::chrono::milliseconds time_limit;

    /**
     * @brief 内存限制（KB），nullopt 表示不限制
     */
    std::optional<long> memory_limit_kb;
};

/**
 * @brief 运行一次程序并分类运行结果
 * 判定顺序：
 * 1. 语言没有可用的运行命令 -> SYSTEM_ERROR ("Run command not configured.")
 * 2. 超时 -> TIME_LIMIT_EXCEEDED
 * 3. 返回值不为 0 或者因为信号退出 -> RUNTIME_ERROR
 * 4. 峰值内存已知且超过内存限制 -> MEMORY_LIMIT_EXCEEDED
 * 5. 否则 -> OK
 *
 * @param request 运行参数
 * @param probe 内存统计，不可用时不会判定 MEMORY_LIMIT_EXCEEDED
 * @throw process_error 若程序无法启动
 */
execution_result execute_program(const execution_request &request, const memory_probe &probe);

}  // namespace arbiter
