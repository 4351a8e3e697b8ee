#pragma once

#include <functional>

#define ARBITER_DEFER_1(x, y) x##y
#define ARBITER_DEFER_2(x, y) ARBITER_DEFER_1(x, y)
#define ARBITER_DEFER_0(x) ARBITER_DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行代码块，无论是正常离开还是因为异常离开
 * @code{.cpp}
 *     defer { std::filesystem::remove(side_file); };
 * @endcode
 */
#define defer auto ARBITER_DEFER_0(_deferred_action) = arbiter::scoped_guard() + [&]

namespace arbiter {

/**
 * @brief 析构时调用 f，f 抛出的异常会被记录到日志而不会继续抛出
 */
struct scoped_guard {
    std::function<void()> f;

    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(std::function<void()> f) const;

    /**
     * @brief 取消执行
     */
    void dismiss();
};

}  // namespace arbiter
