#include <unistd.h>
#include <filesystem>
#include "arbiter/config.hpp"
#include "arbiter/judge/engine.hpp"
#include "gtest/gtest.h"
#include "test/fake_time.hpp"
#include "test/languages.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

// 比较器读取 JSON 格式的 stdin，检查选手输出是否为 1..n 的一个排列
static const char *PERMUTATION_CHECKER = R"SH(payload=$(cat)
n=$(printf '%s' "$payload" | sed 's/.*"input":"\([^"]*\)".*/\1/')
out=$(printf '%s' "$payload" | sed 's/.*"output":"\([^"]*\)".*/\1/')
sorted=$(printf '%s\n' $out | sort -n | tr '\n' ' ')
expected=$(seq 1 "$n" | tr '\n' ' ')
if [ "$sorted" = "$expected" ]; then
    echo '{"verdict": "Accepted"}'
else
    echo false
fi
)SH";

class EngineTest : public ::testing::Test {
protected:
    EngineTest() : eng(memory_probe::disabled()) {}

    judge_request make_request(const string &source, vector<testcase> testcases, const language &lang = shell_language()) {
        judge_request request;
        request.lang = lang;
        request.prob.id = 1000;
        request.prob.points = 100;
        request.prob.time_limit_ms = 2000;
        request.source_code = source;
        request.testcases = move(testcases);
        return request;
    }

    judge_request make_custom_request(const string &source, const string &checker_source, const language &checker_lang = shell_language()) {
        judge_request request = make_request(source, {make_testcase(1, "3", "")});
        request.prob.judge_type = judge_type::CUSTOM;
        request.prob.checker_language_key = checker_lang.key;
        request.prob.checker_source = checker_source;
        request.checker = checker{checker_lang, checker_source};
        return request;
    }

    bool workspaces_removed() {
        for (auto &entry : fs::directory_iterator(RUN_DIR))
            if (entry.path().filename().string().rfind("arbiter-", 0) == 0) return false;
        return true;
    }

    engine eng;
};

TEST_F(EngineTest, Accepted) {
    auto report = eng.judge_submission(make_request("read a b; echo $((a + b))",
                                                    {make_testcase(1, "1 2", "3"), make_testcase(2, "10 20", "30")}));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ(100, report.score);
    EXPECT_FALSE(report.compile_output);
    ASSERT_EQ(2, report.results.size());
    EXPECT_EQ(1, report.results[0].testcase_id);
    EXPECT_EQ("#1", report.results[0].name);
    EXPECT_EQ(status::ACCEPTED, report.results[0].status);
    EXPECT_EQ("3", report.results[0].output);
    EXPECT_FALSE(report.results[0].error);
    EXPECT_FALSE(report.results[0].memory_kb);
    EXPECT_TRUE(report.max_time_ms);
    EXPECT_FALSE(report.max_memory_kb);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, WrongAnswer) {
    auto report = eng.judge_submission(make_request("read a b; echo $((a * b))",
                                                    {make_testcase(1, "2 2", "4"), make_testcase(2, "1 2", "3")}));
    EXPECT_EQ(status::WRONG_ANSWER, report.verdict);
    EXPECT_EQ(0, report.score);
    ASSERT_EQ(2, report.results.size());
    EXPECT_EQ(status::ACCEPTED, report.results[0].status);
    EXPECT_EQ(status::WRONG_ANSWER, report.results[1].status);
    EXPECT_EQ("2", report.results[1].output);
}

TEST_F(EngineTest, OutputNormalization) {
    auto report = eng.judge_submission(make_request("printf '1\\r\\n2  \\r\\n\\n\\n'",
                                                    {make_testcase(1, "", "1\n2\n"), make_testcase(2, "", "1\\n2")}));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ(status::ACCEPTED, report.results[1].status);
}

TEST_F(EngineTest, EscapedInput) {
    auto report = eng.judge_submission(make_request("read a; read b; echo \"$b $a\"", {make_testcase(1, "x\\ny", "y x")}));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
}

TEST_F(EngineTest, TimeLimitExceeded) {
    auto request = make_request("echo 1; sleep 10", {make_testcase(1, "", "1")});
    request.prob.time_limit_ms = 300;
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, report.verdict);
    ASSERT_EQ(1, report.results.size());
    EXPECT_GE(*report.results[0].time_ms, 300);
    EXPECT_LT(*report.results[0].time_ms, 3000);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, LanguageDefaultTimeLimit) {
    language lang = shell_language();
    lang.default_time_limit_ms = 300;
    auto request = make_request("sleep 10", {make_testcase(1, "", "")}, lang);
    request.prob.time_limit_ms = 0;
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, report.verdict);
    EXPECT_LT(*report.max_time_ms, 3000);
}

TEST_F(EngineTest, RuntimeErrorWithCorrectOutput) {
    auto report = eng.judge_submission(make_request("echo 3; echo segfault >&2; exit 1", {make_testcase(1, "", "3")}));
    EXPECT_EQ(status::RUNTIME_ERROR, report.verdict);
    ASSERT_EQ(1, report.results.size());
    EXPECT_EQ("3", report.results[0].output);
    EXPECT_EQ("segfault", report.results[0].error);
}

TEST_F(EngineTest, RuntimeErrorWithEmptyOutput) {
    auto report = eng.judge_submission(make_request("exit 2", {make_testcase(1, "", "")}));
    EXPECT_EQ(status::RUNTIME_ERROR, report.verdict);
    EXPECT_EQ("", report.results[0].output);
    EXPECT_FALSE(report.results[0].error);
}

TEST_F(EngineTest, VerdictIsFirstFailure) {
    auto report = eng.judge_submission(make_request("read a; if [ \"$a\" = 1 ]; then exit 1; fi; echo $a",
                                                    {make_testcase(1, "2", "2"), make_testcase(2, "1", "1"), make_testcase(3, "3", "4")}));
    EXPECT_EQ(status::RUNTIME_ERROR, report.verdict);
    ASSERT_EQ(3, report.results.size());
    EXPECT_EQ(status::WRONG_ANSWER, report.results[2].status);
}

TEST_F(EngineTest, CompilationError) {
    int callbacks = 0;
    auto report = eng.judge_submission(make_request("whatever", {make_testcase(1, "", "")}, broken_language()),
                                       [&](const testcase_result &) { ++callbacks; });
    EXPECT_EQ(status::COMPILATION_ERROR, report.verdict);
    EXPECT_EQ("boom", report.compile_output);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(0, report.score);
    EXPECT_FALSE(report.max_time_ms);
    EXPECT_EQ(0, callbacks);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, CompiledLanguage) {
    auto report = eng.judge_submission(make_request("echo compiled", {make_testcase(1, "", "compiled")}, copying_language()));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_FALSE(report.compile_output);
}

TEST_F(EngineTest, CompilerDiagnosticsAreKept) {
    language lang = copying_language();
    lang.compile_command = command_template{"/bin/sh", "-c", "echo 'warning: unused' >&2; cp \"$0\" \"$1\"", "{src}", "{exe}"};
    auto report = eng.judge_submission(make_request("echo 1", {make_testcase(1, "", "1")}, lang));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ("warning: unused", report.compile_output);
}

TEST_F(EngineTest, RunCommandNotConfigured) {
    language lang = shell_language();
    lang.run_command = nullopt;
    auto report = eng.judge_submission(make_request("echo 1", {make_testcase(1, "", "1"), make_testcase(2, "", "1")}, lang));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    ASSERT_EQ(2, report.results.size());
    EXPECT_EQ(status::SYSTEM_ERROR, report.results[0].status);
    EXPECT_EQ("Run command not configured.", report.results[0].error);
    EXPECT_FALSE(report.results[0].time_ms);
}

TEST_F(EngineTest, NoTestcases) {
    auto report = eng.judge_submission(make_request("echo 1", {}));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ(100, report.score);
    EXPECT_TRUE(report.results.empty());
}

TEST_F(EngineTest, LiveCallback) {
    vector<int64_t> seen;
    auto report = eng.judge_submission(make_request("cat", {make_testcase(1, "a", "a"), make_testcase(2, "b", "c"), make_testcase(3, "d", "d")}),
                                       [&](const testcase_result &result) {
                                           seen.push_back(result.testcase_id);
                                           if (result.testcase_id == 2) EXPECT_EQ(status::WRONG_ANSWER, result.status);
                                       });
    EXPECT_EQ(vector<int64_t>({1, 2, 3}), seen);
    EXPECT_EQ(status::WRONG_ANSWER, report.verdict);
}

TEST_F(EngineTest, GroupScoring) {
    auto request = make_request("cat", {make_testcase(1, "1", "1", 1), make_testcase(2, "2", "2", 1),
                                        make_testcase(3, "3", "3", 2), make_testcase(4, "4", "5", 2)});
    request.prob.groups = {{1, 40}, {2, 60}};
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::WRONG_ANSWER, report.verdict);
    EXPECT_EQ(40, report.score);
}

TEST_F(EngineTest, CustomCheckerAccepted) {
    auto report = eng.judge_submission(make_custom_request("read n; echo 3 1 2", PERMUTATION_CHECKER));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    ASSERT_EQ(1, report.results.size());
    EXPECT_EQ("3 1 2", report.results[0].output);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, CustomCheckerWrongAnswer) {
    auto report = eng.judge_submission(make_custom_request("read n; echo 1 1 2", PERMUTATION_CHECKER));
    EXPECT_EQ(status::WRONG_ANSWER, report.verdict);
}

TEST_F(EngineTest, CompiledChecker) {
    auto report = eng.judge_submission(make_custom_request("read n; echo 2 3 1", PERMUTATION_CHECKER, copying_language()));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
}

TEST_F(EngineTest, CheckerNotRunWhenCandidateFails) {
    auto report = eng.judge_submission(make_custom_request("exit 1", "echo broken >&2; exit 3"));
    EXPECT_EQ(status::RUNTIME_ERROR, report.verdict);
}

TEST_F(EngineTest, CrashingChecker) {
    auto report = eng.judge_submission(make_custom_request("echo 1 2 3", "echo broken >&2; exit 3"));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    ASSERT_EQ(1, report.results.size());
    EXPECT_EQ("broken", report.results[0].error);
    EXPECT_EQ("1 2 3", report.results[0].output);
}

TEST_F(EngineTest, CrashingCheckerWithoutDiagnostics) {
    auto report = eng.judge_submission(make_custom_request("echo 1 2 3", "exit 3"));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("Checker failed.", report.results[0].error);
}

TEST_F(EngineTest, CheckerTimeLimit) {
    auto request = make_custom_request("echo 1 2 3", "sleep 10");
    request.prob.time_limit_ms = 300;
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("Checker failed.", report.results[0].error);
}

TEST_F(EngineTest, UnrecognizedCheckerVerdict) {
    auto report = eng.judge_submission(make_custom_request("echo 1 2 3", "echo maybe"));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("maybe", report.results[0].error);

    report = eng.judge_submission(make_custom_request("echo 1 2 3", "cat > /dev/null"));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("Checker returned an unrecognized verdict.", report.results[0].error);
}

TEST_F(EngineTest, CheckerReceivesPayload) {
    auto request = make_custom_request("cat", R"SH(payload=$(cat)
case "$payload" in
    *'"expectedOutput":"7"'*'"input":"5"'*'"output":"5"'*) echo AC ;;
    *) echo WA ;;
esac
)SH");
    request.testcases = {make_testcase(1, "5", "7")};
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::ACCEPTED, report.verdict);
}

TEST_F(EngineTest, CheckerNotConfigured) {
    auto request = make_custom_request("echo 1", "echo AC");
    request.checker = nullopt;
    int callbacks = 0;
    auto report = eng.judge_submission(request, [&](const testcase_result &) { ++callbacks; });
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("Checker is not configured for this problem.", report.compile_output);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(0, callbacks);
}

TEST_F(EngineTest, CheckerCompilationError) {
    auto report = eng.judge_submission(make_custom_request("echo 1", "echo AC", broken_language()));
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("boom", report.compile_output);
    EXPECT_TRUE(report.results.empty());
    EXPECT_TRUE(workspaces_removed());

    language silent = broken_language();
    silent.compile_command = command_template{"/bin/sh", "-c", "exit 1"};
    report = eng.judge_submission(make_custom_request("echo 1", "echo AC", silent));
    EXPECT_EQ("Failed to compile checker.", report.compile_output);
}

TEST_F(EngineTest, CandidateCompilationErrorComesFirst) {
    auto request = make_custom_request("echo 1", "echo AC");
    request.lang = broken_language();
    request.checker = nullopt;
    auto report = eng.judge_submission(request);
    EXPECT_EQ(status::COMPILATION_ERROR, report.verdict);
}

TEST_F(EngineTest, MemoryLimitExceeded) {
    engine measured(memory_probe::detect(make_fake_time("4096")));
    ASSERT_TRUE(measured.probe().available());

    auto request = make_request("echo 1", {make_testcase(1, "", "1")});
    request.prob.memory_limit_kb = 1024;
    auto report = measured.judge_submission(request);
    EXPECT_EQ(status::MEMORY_LIMIT_EXCEEDED, report.verdict);
    EXPECT_EQ(0, report.score);
    EXPECT_EQ(4096, report.results[0].memory_kb);
    EXPECT_EQ("1", report.results[0].output);
    EXPECT_EQ(4096, report.max_memory_kb);

    request.prob.memory_limit_kb = 4096;
    report = measured.judge_submission(request);
    EXPECT_EQ(status::ACCEPTED, report.verdict);

    request.prob.memory_limit_kb = nullopt;
    report = measured.judge_submission(request);
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ(4096, report.max_memory_kb);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, LanguageDefaultMemoryLimit) {
    engine measured(memory_probe::detect(make_fake_time("4096")));
    language lang = shell_language();
    lang.default_memory_limit_kb = 2048;
    auto report = measured.judge_submission(make_request("echo 1", {make_testcase(1, "", "1")}, lang));
    EXPECT_EQ(status::MEMORY_LIMIT_EXCEEDED, report.verdict);
}

TEST_F(EngineTest, TimeLimitBeforeMemoryLimit) {
    engine measured(memory_probe::detect(make_fake_time("4096")));
    auto request = make_request("sleep 10", {make_testcase(1, "", "")});
    request.prob.time_limit_ms = 300;
    request.prob.memory_limit_kb = 1024;
    auto report = measured.judge_submission(request);
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, report.verdict);
}

TEST_F(EngineTest, UnknownMemoryIsNeverOverLimit) {
    engine measured(memory_probe::detect(make_fake_time("Command terminated by signal 9")));
    auto request = make_request("echo 1", {make_testcase(1, "", "1"), make_testcase(2, "", "1")});
    request.prob.memory_limit_kb = 1;
    auto report = measured.judge_submission(request);
    EXPECT_EQ(status::ACCEPTED, report.verdict);
    EXPECT_EQ(100, report.score);
    EXPECT_FALSE(report.results[0].memory_kb);
    EXPECT_FALSE(report.max_memory_kb);
    EXPECT_TRUE(report.max_time_ms);
}

TEST_F(EngineTest, LeadingWhitespaceIsSignificant) {
    auto report = eng.judge_submission(make_request("printf '  *\\n ***\\n'",
                                                    {make_testcase(1, "", "  *\n ***"), make_testcase(2, "", "*\n***")}));
    ASSERT_EQ(2, report.results.size());
    EXPECT_EQ(status::ACCEPTED, report.results[0].status);
    EXPECT_EQ(status::WRONG_ANSWER, report.results[1].status);
    EXPECT_EQ("*\n ***", report.results[0].output);

    report = eng.judge_submission(make_request("echo '  3'", {make_testcase(1, "", "  3")}));
    EXPECT_EQ(status::ACCEPTED, report.verdict);
}

TEST_F(EngineTest, RunCode) {
    run_request request;
    request.lang = shell_language();
    request.source_code = "read a; read b; echo \"$a+$b\"; echo note >&2";
    request.input = "1\\n2";
    auto report = eng.run_code(request);
    EXPECT_EQ(status::RAN, report.status);
    EXPECT_EQ("1+2", report.output);
    EXPECT_EQ("note", report.error);
    EXPECT_TRUE(report.time_ms);
    EXPECT_FALSE(report.compile_output);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(EngineTest, RunCodeEmptyOutput) {
    run_request request;
    request.lang = shell_language();
    request.source_code = "true";
    auto report = eng.run_code(request);
    EXPECT_EQ(status::RAN, report.status);
    EXPECT_FALSE(report.output);
}

TEST_F(EngineTest, RunCodeFailures) {
    run_request request;
    request.lang = broken_language();
    request.source_code = "x";
    auto report = eng.run_code(request);
    EXPECT_EQ(status::COMPILATION_ERROR, report.status);
    EXPECT_EQ("boom", report.compile_output);
    EXPECT_FALSE(report.time_ms);
    EXPECT_FALSE(report.output);

    request.lang = shell_language();
    request.lang.default_time_limit_ms = 300;
    request.source_code = "sleep 10";
    report = eng.run_code(request);
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, report.status);
}
