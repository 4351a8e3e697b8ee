#include "arbiter/judge/problem.hpp"
#include <algorithm>
#include <tuple>
#include "arbiter/common/json_utils.hpp"
#include "arbiter/config.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

chrono::milliseconds problem::effective_time_limit(const language &lang) const {
    // 0 表示没有设置时间限制
    if (time_limit_ms && *time_limit_ms > 0) return chrono::milliseconds(*time_limit_ms);
    if (lang.default_time_limit_ms && *lang.default_time_limit_ms > 0) return chrono::milliseconds(*lang.default_time_limit_ms);
    return DEFAULT_TIME_LIMIT;
}

optional<long> problem::effective_memory_limit(const language &lang) const {
    if (memory_limit_kb) return *memory_limit_kb;
    if (lang.default_memory_limit_kb) return *lang.default_memory_limit_kb;
    return nullopt;
}

int problem::group_points(int64_t group_id) const {
    auto it = find_if(groups.begin(), groups.end(), [&](const testcase_group &group) { return group.id == group_id; });
    return it == groups.end() ? 0 : it->points;
}

const char *get_judge_type_name(judge_type type) {
    return type == judge_type::CUSTOM ? "custom" : "default";
}

void from_json(const json &j, testcase_group &group) {
    j.at("id").get_to(group.id);
    group.points = get_value_def<int>(j, 0, "points");
}

void from_json(const json &j, problem &prob) {
    prob.id = get_value_def<int64_t>(j, 0, "id");
    prob.time_limit_ms = get_optional<int>(j, "time_limit_ms");
    prob.memory_limit_kb = get_optional<int>(j, "memory_limit_kb");
    prob.judge_type = get_value_def<string>(j, "default", "judge_type") == "custom" ? judge_type::CUSTOM : judge_type::DEFAULT;
    prob.checker_language_key = get_optional<string>(j, "checker_language_key");
    prob.checker_source = get_optional<string>(j, "checker_source");
    prob.points = get_value_def<int>(j, 0, "points");
    prob.groups = get_optional<vector<testcase_group>>(j, "groups").value_or(vector<testcase_group>{});
}

void from_json(const json &j, testcase &kase) {
    kase.id = get_value_def<int64_t>(j, 0, "id");
    kase.name = get_value_def<string>(j, "", "name");
    kase.input = get_value_def<string>(j, "", "input");
    kase.expected_output = get_value_def<string>(j, "", "expected_output");
    kase.group_id = get_optional<int64_t>(j, "group_id");
    kase.sort_order = get_value_def<int>(j, 0, "sort_order");
}

void sort_testcases(vector<testcase> &testcases) {
    stable_sort(testcases.begin(), testcases.end(), [](const testcase &a, const testcase &b) {
        return tie(a.sort_order, a.id) < tie(b.sort_order, b.id);
    });
}

}  // namespace arbiter
