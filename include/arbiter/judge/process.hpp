#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 一次子进程运行的原始结果
 */
struct execution_outcome {
    /**
     * @brief 子进程的返回值
     * 若子进程因为信号退出，则为 nullopt，信号保存在 signal 中
     */
    std::optional<int> exit_code;

    /**
     * @brief 导致子进程退出的信号，正常退出时为 nullopt
     */
    std::optional<int> signal;

    /**
     * @brief 子进程的 stdout，最多保存 OUTPUT_LIMIT 字节
     */
    std::string stdout_text;

    /**
     * @brief 子进程的 stderr，最多保存 OUTPUT_LIMIT 字节
     */
    std::string stderr_text;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 子进程的运行时间（时钟时间）
     */
    std::chrono::milliseconds wall_time{0};

    /**
     * @brief 子进程是否因为超时被强制结束
     * 超时是正常的运行结果，而不是异常
     */
    bool timed_out = false;

    /**
     * @brief 子进程是否正常退出且返回值为 0
     */
    bool succeeded() const;
};

/**
 * @brief 子进程的运行参数
 */
struct process_options {
    /**
     * @brief 子进程的工作路径
     */
    std::filesystem::path cwd;

    /**
     * @brief 喂给子进程 stdin 的数据，写完后立刻关闭 stdin
     * nullopt 表示不写入任何数据，直接关闭 stdin
     */
    std::optional<std::string> input;

    /**
     * @brief 时钟时间限制，超时后通过 SIGKILL 杀死整个进程组
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout、stderr 各自最多保存多少字节
     */
    std::size_t output_limit = 0;
};

/**
 * @brief 运行一个子进程并等待其结束
 * 1. 创建 stdin/stdout/stderr 管道，以及一个 close-on-exec 的管道用于报告 exec 失败
 * 2. fork 出子进程，子进程进入独立的进程组并切换工作路径后调用 execvp
 * 3. 父进程通过 poll 同时写入 stdin、读取 stdout 和 stderr，超出 output_limit 的数据被丢弃
 * 4. 到达时间限制时向整个进程组发送 SIGKILL，并标记 timed_out
 * 5. 无论如何都会调用 waitpid 回收子进程，避免僵尸进程
 *
 * @param argv 命令行参数，argv[0] 为程序路径（会在 PATH 中查找）
 * @param options 运行参数
 * @return 运行结果
 * @throw process_error 若子进程无法启动（程序不存在、没有执行权限、工作路径不存在）
 * @throw std::system_error 若创建管道、fork 等系统调用失败
 */
execution_outcome run_process(const std::vector<std::string> &argv, const process_options &options);

}  // namespace arbiter
