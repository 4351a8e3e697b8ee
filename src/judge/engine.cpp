#include "arbiter/judge/engine.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <memory>
#include "arbiter/common/text_utils.hpp"
#include "arbiter/config.hpp"
#include "arbiter/judge/compiler.hpp"
#include "arbiter/judge/executor.hpp"
#include "arbiter/judge/scoring.hpp"
#include "arbiter/judge/verifier.hpp"
#include "arbiter/judge/workspace.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

static const char *SOURCE_NAME = "Main";
static const char *EXECUTABLE_NAME = "main";
static const char *CHECKER_SOURCE_NAME = "Checker";
static const char *CHECKER_EXECUTABLE_NAME = "checker";

static command_paths prepare_program(const workspace &work, const language &lang, const string &name, const string &exe_name, const string &source_code) {
    fs::path src = work.write(name + "." + lang.source_ext, source_code);
    return {src, work.file(exe_name), work.path()};
}

engine::engine(memory_probe probe) : mem_probe(move(probe)) {}

const memory_probe &engine::probe() const {
    return mem_probe;
}

judge_report engine::judge_submission(const judge_request &request, const result_callback &on_result) const {
    judge_report report;
    const problem &prob = request.prob;

    workspace work("arbiter-");
    command_paths paths = prepare_program(work, request.lang, SOURCE_NAME, EXECUTABLE_NAME, request.source_code);

    LOG(INFO) << "Judging problem " << prob.id << " in " << request.lang.key
              << " with " << request.testcases.size() << " testcases (" << get_judge_type_name(prob.judge_type) << ")";

    compile_result compiled = compile_program(request.lang, paths.src, paths.exe, paths.workdir);
    if (!compiled.ok) {
        LOG(INFO) << "Problem " << prob.id << ": compilation error";
        report.verdict = status::COMPILATION_ERROR;
        report.compile_output = compiled.output;
        return report;
    }

    auto time_limit = prob.effective_time_limit(request.lang);
    auto memory_limit = prob.effective_memory_limit(request.lang);

    // 比较器的工作区需要在整个评测过程中存在，析构时与选手工作区一起删除
    unique_ptr<workspace> checker_work;
    unique_ptr<verifier> verify;
    if (prob.judge_type == judge_type::CUSTOM) {
        if (!request.checker) {
            LOG(ERROR) << "Problem " << prob.id << " is judged by checker, but the checker is not configured";
            report.verdict = status::SYSTEM_ERROR;
            report.compile_output = "Checker is not configured for this problem.";
            return report;
        }

        const checker &chk = *request.checker;
        checker_work = make_unique<workspace>("arbiter-checker-");
        command_paths checker_paths = prepare_program(*checker_work, chk.language, CHECKER_SOURCE_NAME, CHECKER_EXECUTABLE_NAME, chk.source_code);

        compile_result checker_compiled = compile_program(chk.language, checker_paths.src, checker_paths.exe, checker_paths.workdir);
        if (!checker_compiled.ok) {
            LOG(ERROR) << "Problem " << prob.id << ": failed to compile checker";
            report.verdict = status::SYSTEM_ERROR;
            report.compile_output = checker_compiled.output && !checker_compiled.output->empty()
                                        ? *checker_compiled.output
                                        : "Failed to compile checker.";
            return report;
        }

        verify = make_unique<checker_verifier>(chk.language, checker_paths, min(time_limit, CHECKER_TIME_LIMIT), memory_limit, mem_probe);
    } else {
        verify = make_unique<diff_verifier>();
    }

    for (auto &kase : request.testcases) {
        string input = decode_testcase_text(kase.input);
        string expected_output = decode_testcase_text(kase.expected_output);

        execution_result exec = execute_program({request.lang, paths, input, time_limit, memory_limit}, mem_probe);

        testcase_result result;
        result.testcase_id = kase.id;
        result.name = kase.name;
        result.status = exec.status;
        result.time_ms = exec.time_ms;
        result.memory_kb = exec.memory_kb;
        result.output = exec.output;
        result.error = exec.error;

        if (exec.status == status::OK) {
            verification checked = verify->verify(input, expected_output, exec);
            result.status = checked.status;
            result.error = checked.error;
        }

        LOG(INFO) << "Problem " << prob.id << ", testcase " << kase.id << ": " << get_display_message(result.status);

        report.results.push_back(result);
        if (on_result) on_result(report.results.back());
    }

    summarize(report, prob, request.testcases);
    report.compile_output = compiled.output;

    LOG(INFO) << "Problem " << prob.id << " judged: " << get_display_message(report.verdict) << ", score " << report.score;
    return report;
}

run_report engine::run_code(const run_request &request) const {
    run_report report;

    workspace work("arbiter-");
    command_paths paths = prepare_program(work, request.lang, SOURCE_NAME, EXECUTABLE_NAME, request.source_code);

    compile_result compiled = compile_program(request.lang, paths.src, paths.exe, paths.workdir);
    report.compile_output = compiled.output;
    if (!compiled.ok) {
        report.status = status::COMPILATION_ERROR;
        return report;
    }

    execution_result exec = execute_program({request.lang, paths, decode_testcase_text(request.input),
                                             request.prob.effective_time_limit(request.lang),
                                             request.prob.effective_memory_limit(request.lang)},
                                            mem_probe);

    report.status = exec.status == status::OK ? status::RAN : exec.status;
    report.time_ms = exec.time_ms;
    report.memory_kb = exec.memory_kb;
    report.output = exec.output;
    report.error = exec.error;

    LOG(INFO) << "Ran code in " << request.lang.key << ": " << get_display_message(report.status);
    return report;
}

}  // namespace arbiter
