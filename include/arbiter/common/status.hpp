#pragma once

namespace arbiter {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 枚举值的顺序即整个提交评测结果的显示优先级：
 * 按测试点的存储顺序，第一个非 ACCEPTED 的测试点结果就是整个提交的结果
 */
enum class status {
    /**
     * @brief 用户程序本测试点评测通过
     * 比较时会忽略 CRLF 与 LF 的区别以及末尾空白字符
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 输出与标准输出不一致，或者比较器判定输出错误
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 比较的是时钟时间，超时的程序会被 SIGKILL 强制结束
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * 仅在内存统计可用（系统中存在 GNU time）时才会返回
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值不为 0 或者因为信号崩溃。即使输出正确，也会返回该结果
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 内部错误，评测系统出错
     * 比如语言没有配置运行命令、比较器崩溃或者返回了无法识别的结果
     */
    SYSTEM_ERROR = 5,

    /**
     * @brief 用户程序编译错误
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 用户程序正常运行结束，还未比较输出
     * 只在评测系统内部使用，不会作为测试点的最终结果
     */
    OK = 7,

    /**
     * @brief 自定义输入运行正常结束
     * run_code 的结果中 OK 会被替换为 RAN
     */
    RAN = 8
};

const char *get_display_message(status);

}  // namespace arbiter
