#pragma once

#include <vector>
#include "arbiter/judge/problem.hpp"
#include "arbiter/judge/report.hpp"

/**
 * 汇总测试点结果
 */
namespace arbiter {

/**
 * @brief 按照测试点的评测顺序，返回第一个不是 ACCEPTED 的结果
 * @return 第一个不是 ACCEPTED 的结果，若全部通过或者没有测试点，返回 ACCEPTED
 */
status overall_verdict(const std::vector<testcase_result> &results);

/**
 * @brief 计算提交的得分
 * 若存在属于分组的测试点，得分为所有测试点都通过的分组的分数之和，不属于任何分组的测试点不计分；
 * 否则所有测试点都通过时得到题目的总分，否则为 0 分
 *
 * @param prob 题目，提供总分和分组的分数
 * @param testcases 评测的测试点，提供测试点所属的分组
 * @param results 测试点结果，与 testcases 按下标一一对应，缺少的结果视为未通过
 */
int compute_score(const problem &prob, const std::vector<testcase> &testcases, const std::vector<testcase_result> &results);

/**
 * @brief 根据 report.results 填充 verdict、score、max_time_ms、max_memory_kb
 */
void summarize(judge_report &report, const problem &prob, const std::vector<testcase> &testcases);

}  // namespace arbiter
