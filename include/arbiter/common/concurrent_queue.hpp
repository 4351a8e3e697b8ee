#pragma once

#include <condition_variable>
#include <cstddef>
#include <limits>
#include <mutex>
#include <optional>
#include <queue>

namespace arbiter {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列满时 push 阻塞，队列空时 pop 阻塞。调用 close 之后不再接受新元素，
 * 但是已经在队列中的元素仍然可以被取出。
 * @param <T> 队列元素类型，要求可移动
 */
template <typename T>
struct concurrent_queue {
    /**
     * @param capacity 队列最多可以容纳多少个元素
     */
    explicit concurrent_queue(std::size_t capacity = std::numeric_limits<std::size_t>::max())
        : capacity(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素为止
     * @return 队列头元素，若队列已经关闭且为空则返回 nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        not_empty.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素，队列已满时阻塞等待
     * @return false 若队列已经关闭，此时 value 不会被插入
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return q.size() < capacity || closed; });
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待的读者和写者
     */
    void close() {
        {
            std::lock_guard<std::mutex> mlock(mut);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

    std::size_t size() {
        std::lock_guard<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable not_empty, not_full;
};

}  // namespace arbiter
