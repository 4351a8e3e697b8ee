#include "arbiter/judge/request.hpp"
#include <glog/logging.h>
#include "arbiter/common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

static problem parse_problem(const json &j) {
    json value = access_optional(j, "problem");
    if (value.is_null()) return problem();
    if (!value.is_object()) throw build_invalid_argument(j, "problem");
    return value.get<problem>();
}

static optional<checker> resolve_checker(const problem &prob, const language_registry &languages) {
    if (prob.judge_type != judge_type::CUSTOM) return nullopt;
    if (!prob.checker_language_key || !prob.checker_source || prob.checker_source->empty()) return nullopt;

    auto lang = languages.find(*prob.checker_language_key);
    if (!lang) {
        LOG(WARNING) << "Checker language " << *prob.checker_language_key << " of problem " << prob.id << " is not configured";
        return nullopt;
    }
    return checker{*lang, *prob.checker_source};
}

judge_request parse_judge_request(const json &j, const language_registry &languages) {
    judge_request request;
    request.lang = languages.at(get_value<string>(j, "language"));
    request.source_code = get_value<string>(j, "source_code");
    request.prob = parse_problem(j);
    request.testcases = get_optional<vector<testcase>>(j, "testcases").value_or(vector<testcase>{});
    sort_testcases(request.testcases);
    request.checker = resolve_checker(request.prob, languages);
    return request;
}

run_request parse_run_request(const json &j, const language_registry &languages) {
    run_request request;
    request.lang = languages.at(get_value<string>(j, "language"));
    request.source_code = get_value<string>(j, "source_code");
    request.prob = parse_problem(j);
    request.input = get_value_def<string>(j, "", "input");
    return request;
}

}  // namespace arbiter
