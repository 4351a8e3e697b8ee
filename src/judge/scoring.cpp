#include "arbiter/judge/scoring.hpp"
#include <algorithm>
#include <map>

namespace arbiter {
using namespace std;

status overall_verdict(const vector<testcase_result> &results) {
    for (auto &result : results)
        if (result.status != status::ACCEPTED)
            return result.status;
    return status::ACCEPTED;
}

int compute_score(const problem &prob, const vector<testcase> &testcases, const vector<testcase_result> &results) {
    bool grouped = any_of(testcases.begin(), testcases.end(), [](const testcase &kase) { return kase.group_id.has_value(); });
    if (!grouped) return overall_verdict(results) == status::ACCEPTED ? prob.points : 0;

    // 测试点结果按评测顺序存放，第 i 个结果对应第 i 个测试点
    map<int64_t, bool> passed;
    for (size_t i = 0; i < testcases.size(); ++i) {
        auto &kase = testcases[i];
        if (!kase.group_id) continue;
        bool accepted = i < results.size() && results[i].status == status::ACCEPTED;
        auto [entry, inserted] = passed.emplace(*kase.group_id, accepted);
        if (!inserted) entry->second = entry->second && accepted;
    }

    int score = 0;
    for (auto &[group_id, all_passed] : passed)
        if (all_passed) score += prob.group_points(group_id);
    return score;
}

void summarize(judge_report &report, const problem &prob, const vector<testcase> &testcases) {
    report.verdict = overall_verdict(report.results);
    report.score = compute_score(prob, testcases, report.results);

    report.max_time_ms = nullopt;
    report.max_memory_kb = nullopt;
    for (auto &result : report.results) {
        if (result.time_ms && (!report.max_time_ms || *result.time_ms > *report.max_time_ms))
            report.max_time_ms = result.time_ms;
        if (result.memory_kb && (!report.max_memory_kb || *result.memory_kb > *report.max_memory_kb))
            report.max_memory_kb = result.memory_kb;
    }
}

}  // namespace arbiter
