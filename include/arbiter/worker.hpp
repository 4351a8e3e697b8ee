#pragma once

#include <cstddef>
#include <future>
#include <thread>
#include <vector>
#include "arbiter/common/concurrent_queue.hpp"
#include "arbiter/judge/engine.hpp"

/**
 * 评测服务相关函数
 * 调用方通过 submit 提交评测请求，提交后立刻返回一个 future，评测在 worker 线程中进行。
 * 因此"提交被接受"与"评测完成"是两件事：调用方需要通过 future 或者 on_result 回调
 * 获取评测结果。
 *
 * 每个 worker 线程都会从有界的评测队列中取出评测请求，评测完成后将结果写入请求的 promise。
 * 评测队列已满时 submit 会阻塞，避免评测请求无限堆积。
 */
namespace arbiter {

struct worker_pool {
    /**
     * @brief 启动 worker 线程
     * @param eng 评测引擎，必须比 worker_pool 活得更久
     * @param worker_count worker 线程数，至少为 1
     * @param queue_capacity 评测队列最多可以容纳多少个等待评测的请求
     */
    worker_pool(const engine &eng, std::size_t worker_count, std::size_t queue_capacity);

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 停止 worker 并等待剩余的评测请求评测完成
     */
    ~worker_pool();

    /**
     * @brief 提交一个评测请求
     * 评测过程中抛出的异常不会传给调用方，而是转换为 SYSTEM_ERROR 的评测结果，
     * 此时 compile_output 为异常信息，得分为 0
     * @param request 评测请求
     * @param on_result 每个测试点评测完成后的回调，在 worker 线程中调用
     * @return 评测结果
     * @throw internal_error 若 worker 已经停止
     */
    std::future<judge_report> submit(judge_request request, result_callback on_result = {});

    /**
     * @brief 停止所有的 worker
     * 调用该函数后不再接受新的评测请求，已经在队列中的评测请求仍然会被评测，
     * 所有评测请求评测完成后 worker 退出，该函数等待所有 worker 退出后返回。
     */
    void stop();

    std::size_t pending();

private:
    struct job {
        judge_request request;
        result_callback on_result;
        std::promise<judge_report> promise;
    };

    void worker_loop(std::size_t worker_id);

    const engine &eng;
    concurrent_queue<job> jobs;
    std::vector<std::thread> workers;
};

}  // namespace arbiter
