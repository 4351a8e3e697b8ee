#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "arbiter/judge/language.hpp"

namespace arbiter {

/**
 * @brief 编译结果
 */
struct compile_result {
    /**
     * @brief 是否编译成功，解释型语言总是成功
     */
    bool ok = true;

    /**
     * @brief 编译器的输出（stdout 与 stderr 拼接后去除首尾空白字符）
     * 编译成功且编译器没有任何输出时为 nullopt
     */
    std::optional<std::string> output;
};

/**
 * @brief 编译选手程序或比较器
 * 语言没有编译命令时直接返回成功。编译命令在 workdir 下运行，没有 stdin，
 * 时间限制为 COMPILE_TIME_LIMIT，返回值不为 0 或者超时均视为编译失败。
 *
 * @param lang 源代码的语言
 * @param src 源代码路径，对应占位符 {src}
 * @param exe 可执行文件路径，对应占位符 {exe}
 * @param workdir 工作区路径，对应占位符 {workdir}
 * @throw process_error 若编译器无法启动
 */
compile_result compile_program(const language &lang, const std::filesystem::path &src, const std::filesystem::path &exe, const std::filesystem::path &workdir);

}  // namespace arbiter
