#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

/**
 * @brief 统计子进程峰值内存（常驻内存）的能力
 * 通过 GNU time 包装被测命令：time -o <side file> -f %M <argv...>，
 * 子进程结束后 GNU time 会把峰值内存（KB）写入 side file。
 *
 * 评测系统启动时调用 detect 检测一次，之后只读，可以被多个 worker 共享。
 * 系统中没有 GNU time 时内存统计被关闭，所有运行的内存都是未知的。
 */
struct memory_probe {
    /**
     * @brief 检测 time_command 是否存在且可执行
     * @param time_command GNU time 的路径
     * @return 若可执行，返回启用的 memory_probe，否则返回关闭的 memory_probe
     */
    static memory_probe detect(const std::filesystem::path &time_command);

    /**
     * @brief 使用 TIME_COMMAND_PATH 检测
     */
    static memory_probe detect();

    /**
     * @brief 构造一个关闭的 memory_probe
     */
    static memory_probe disabled();

    bool available() const;

    /**
     * @brief 用 GNU time 包装被测命令
     * 内存统计关闭时原样返回 argv
     * @param argv 被测命令
     * @param side_file GNU time 输出峰值内存的文件
     */
    std::vector<std::string> wrap(const std::vector<std::string> &argv, const std::filesystem::path &side_file) const;

    /**
     * @brief 读取 side file 中的峰值内存，无论成功与否都会删除 side file
     * GNU time 在子进程返回值不为 0 时会先输出一行 "Command exited with non-zero status"，
     * 因此取最后一个非空行作为峰值内存
     * @return 峰值内存（KB），若内存统计关闭、文件不存在或者格式错误，返回 nullopt
     */
    std::optional<long> read_peak(const std::filesystem::path &side_file) const;

private:
    explicit memory_probe(std::filesystem::path time_command);

    std::filesystem::path time_command;
};

}  // namespace arbiter
