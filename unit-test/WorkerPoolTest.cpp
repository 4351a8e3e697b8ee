#include <atomic>
#include "arbiter/common/exceptions.hpp"
#include "arbiter/config.hpp"
#include "arbiter/worker.hpp"
#include "gtest/gtest.h"
#include "test/languages.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

class WorkerPoolTest : public ::testing::Test {
protected:
    WorkerPoolTest() : eng(memory_probe::disabled()) {}

    judge_request make_request(int64_t problem_id, const string &source, const string &expected_output) {
        judge_request request;
        request.lang = shell_language();
        request.prob.id = problem_id;
        request.prob.points = 10;
        request.source_code = source;
        request.testcases = {make_testcase(1, "", expected_output), make_testcase(2, "", expected_output)};
        return request;
    }

    engine eng;
};

TEST_F(WorkerPoolTest, JudgesConcurrently) {
    worker_pool pool(eng, 3, 2);
    atomic<int> callbacks(0);
    vector<future<judge_report>> reports;
    for (int i = 0; i < 6; ++i) {
        string answer = to_string(i);
        // 奇数号提交输出错误
        string source = "echo " + (i % 2 ? string("wrong") : answer);
        reports.push_back(pool.submit(make_request(i, source, answer), [&](const testcase_result &) { ++callbacks; }));
    }

    for (int i = 0; i < 6; ++i) {
        judge_report report = reports[i].get();
        EXPECT_EQ(i % 2 ? status::WRONG_ANSWER : status::ACCEPTED, report.verdict) << "submission " << i;
        EXPECT_EQ(i % 2 ? 0 : 10, report.score);
        EXPECT_EQ(2, report.results.size());
    }
    EXPECT_EQ(12, callbacks);
}

TEST_F(WorkerPoolTest, ExceptionBecomesSystemError) {
    fs::path run_dir = RUN_DIR;
    RUN_DIR = run_dir / "missing";
    worker_pool pool(eng, 1, 1);
    judge_report report = pool.submit(make_request(1, "echo 1", "1")).get();
    RUN_DIR = run_dir;

    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ(0, report.score);
    ASSERT_TRUE(report.compile_output);
    EXPECT_NE(string::npos, report.compile_output->find("unable to create workspace"));
    EXPECT_TRUE(report.results.empty());
}

TEST_F(WorkerPoolTest, CallbackFailureBecomesSystemError) {
    worker_pool pool(eng, 1, 1);
    auto report = pool.submit(make_request(1, "echo 1", "1"), [](const testcase_result &) {
                          throw runtime_error("database is gone");
                      }).get();
    EXPECT_EQ(status::SYSTEM_ERROR, report.verdict);
    EXPECT_EQ("database is gone", report.compile_output);
    EXPECT_EQ(0, report.score);
}

TEST_F(WorkerPoolTest, StopDrainsQueue) {
    worker_pool pool(eng, 1, 4);
    auto first = pool.submit(make_request(1, "sleep 0.2; echo 1", "1"));
    auto second = pool.submit(make_request(2, "echo 2", "2"));
    pool.stop();
    EXPECT_EQ(0, pool.pending());
    EXPECT_EQ(status::ACCEPTED, first.get().verdict);
    EXPECT_EQ(status::ACCEPTED, second.get().verdict);
}

TEST_F(WorkerPoolTest, SubmitAfterStop) {
    worker_pool pool(eng, 1, 1);
    pool.stop();
    EXPECT_THROW(pool.submit(make_request(1, "echo 1", "1")), internal_error);
}
