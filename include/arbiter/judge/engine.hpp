#pragma once

#include <functional>
#include "arbiter/judge/memory_probe.hpp"
#include "arbiter/judge/report.hpp"
#include "arbiter/judge/request.hpp"

namespace arbiter {

/**
 * @brief 每个测试点评测完成后的回调
 * 调用方可以借此增量保存测试点结果，而不需要等待整个提交评测完成
 */
using result_callback = std::function<void(const testcase_result &)>;

/**
 * @brief 评测引擎
 * 评测流程：编译选手程序 -> 编译比较器（仅比较器评测）-> 依次评测每个测试点 -> 汇总
 * 编译失败或者比较器配置错误时直接结束，不评测任何测试点。
 *
 * 每次评测都在独立的工作区中进行，引擎本身只持有只读的内存统计能力，
 * 因此同一个引擎可以被多个线程同时使用。
 */
struct engine {
    /**
     * @param probe 内存统计能力，通常为 memory_probe::detect() 的结果
     */
    explicit engine(memory_probe probe);

    /**
     * @brief 评测一个提交
     * 测试点按照 request.testcases 的顺序串行评测，避免并行运行影响时间统计
     * @param request 评测请求
     * @param on_result 每个测试点评测完成后的回调，可以为空
     * @return 评测结果
     * @throw workspace_error 若无法创建工作区
     * @throw process_error 若程序无法启动
     */
    judge_report judge_submission(const judge_request &request, const result_callback &on_result = {}) const;

    /**
     * @brief 使用自定义输入运行程序，不比较输出
     * @return 运行结果，正常结束时为 RAN
     * @throw workspace_error 若无法创建工作区
     * @throw process_error 若程序无法启动
     */
    run_report run_code(const run_request &request) const;

    const memory_probe &probe() const;

private:
    memory_probe mem_probe;
};

}  // namespace arbiter
