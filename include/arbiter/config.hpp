#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace arbiter {

/**
 * @brief 选手程序 stdout、stderr 各自最多保存多少字节
 * 超出部分会被读取并丢弃，避免选手程序无限输出导致评测系统内存爆炸
 * @defaultValue 64KiB
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 编译选手程序、比较器的时间限制
 * 与题目的时间限制无关
 * @defaultValue 10s
 */
extern std::chrono::milliseconds COMPILE_TIME_LIMIT;

/**
 * @brief 比较器的时间限制上限
 * 比较器实际的时间限制为题目时间限制与该值的较小值，因为比较器应该是轻量的
 * @defaultValue 2s
 */
extern std::chrono::milliseconds CHECKER_TIME_LIMIT;

/**
 * @brief 题目和语言都没有提供时间限制时使用的时间限制
 * @defaultValue 2s
 */
extern std::chrono::milliseconds DEFAULT_TIME_LIMIT;

/**
 * @brief GNU time 的路径，用于测量选手程序的峰值内存
 * 若该路径不存在或不可执行，内存统计将被关闭，此时无法判定 Memory Limit Exceeded
 */
extern std::filesystem::path TIME_COMMAND_PATH;

/**
 * @brief 评测工作区的根目录
 * 每个提交都会在该目录下创建独立的临时文件夹，评测结束后删除
 *
 * RUN_DIR
 * ├── arbiter-XXXXXX // 选手程序的工作区
 * │   ├── Main.cpp // 选手程序的代码（扩展名由语言决定）
 * │   ├── main // 编译产生的可执行文件
 * │   └── time-XXXXXX // 内存统计的临时文件，每次运行后删除
 * └── arbiter-checker-XXXXXX // 比较器的工作区
 *     ├── Checker.cpp
 *     └── checker
 *
 * @defaultValue /tmp
 */
extern std::filesystem::path RUN_DIR;

}  // namespace arbiter
