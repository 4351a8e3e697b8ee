#include "arbiter/judge/report.hpp"
#include "arbiter/common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

judge_report make_system_error_report(const string &message) {
    judge_report report;
    report.verdict = status::SYSTEM_ERROR;
    report.compile_output = message;
    report.score = 0;
    return report;
}

void to_json(json &j, const testcase_result &result) {
    j = json{{"testcase_id", result.testcase_id},
             {"name", result.name},
             {"status", get_display_message(result.status)}};
    put_optional(j, "exec_time_ms", result.time_ms);
    put_optional(j, "memory_kb", result.memory_kb);
    put_optional(j, "output", result.output);
    put_optional(j, "error", result.error);
}

void to_json(json &j, const judge_report &report) {
    j = json{{"verdict", get_display_message(report.verdict)},
             {"results", report.results},
             {"score", report.score}};
    put_optional(j, "compile_output", report.compile_output);
    put_optional(j, "max_time_ms", report.max_time_ms);
    put_optional(j, "max_memory_kb", report.max_memory_kb);
}

void to_json(json &j, const run_report &report) {
    j = json{{"status", get_display_message(report.status)}};
    put_optional(j, "compile_output", report.compile_output);
    put_optional(j, "exec_time_ms", report.time_ms);
    put_optional(j, "memory_kb", report.memory_kb);
    put_optional(j, "output", report.output);
    put_optional(j, "error", report.error);
}

}  // namespace arbiter
