#include "arbiter/judge/verifier.hpp"
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "arbiter/common/text_utils.hpp"
#include "arbiter/judge/checker_verdict.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

verifier::~verifier() = default;

verification diff_verifier::verify(const string &, const string &expected_output, const execution_result &result) {
    string expected = normalize_output(expected_output);
    string actual = normalize_output(result.raw_output);
    return {expected == actual ? status::ACCEPTED : status::WRONG_ANSWER, result.error};
}

checker_verifier::checker_verifier(const language &lang, command_paths paths, chrono::milliseconds time_limit, optional<long> memory_limit_kb, const memory_probe &probe)
    : lang(lang), paths(move(paths)), time_limit(time_limit), memory_limit_kb(memory_limit_kb), probe(probe) {}

verification checker_verifier::verify(const string &input, const string &expected_output, const execution_result &result) {
    json payload = {{"input", input},
                    {"expectedOutput", expected_output},
                    {"output", result.output.value_or("")}};

    execution_result checker = execute_program({lang, paths, payload.dump(), time_limit, memory_limit_kb}, probe);

    if (checker.status != status::OK) {
        LOG(ERROR) << "Checker finished with " << get_display_message(checker.status)
                   << ", stderr: " << checker.error.value_or("");
        if (checker.error) return {status::SYSTEM_ERROR, checker.error};
        if (checker.output && !checker.output->empty()) return {status::SYSTEM_ERROR, checker.output};
        return {status::SYSTEM_ERROR, string("Checker failed.")};
    }

    auto verdict = parse_checker_verdict(checker.output.value_or(""));
    if (!verdict) {
        LOG(ERROR) << "Checker returned an unrecognized verdict: " << checker.output.value_or("");
        return {status::SYSTEM_ERROR, checker.output.value_or("Checker returned an unrecognized verdict.")};
    }
    return {*verdict, result.error};
}

}  // namespace arbiter
