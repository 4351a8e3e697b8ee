#pragma once

#include <chrono>

namespace arbiter {

/**
 * @brief 计时器，构造时开始计时
 * 使用单调时钟，不受系统时间调整的影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace arbiter
