#include "arbiter/common/exceptions.hpp"
#include "arbiter/judge/request.hpp"
#include "gtest/gtest.h"
#include "test/languages.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
using namespace nlohmann;

class RequestTest : public ::testing::Test {
protected:
    void SetUp() override {
        languages.add(shell_language());
        languages.add(copying_language());
    }

    language_registry languages;
};

TEST_F(RequestTest, ParseJudgeRequest) {
    json j = R"({
        "language": "sh",
        "source_code": "echo 1",
        "problem": {
            "id": 7,
            "time_limit_ms": 1500,
            "memory_limit_kb": 65536,
            "points": 100,
            "groups": [{"id": 1, "points": 40}, {"id": 2, "points": 60}]
        },
        "testcases": [
            {"id": 3, "name": "c", "input": "3", "expected_output": "3", "sort_order": 2, "group_id": 2},
            {"id": 2, "name": "b", "input": "2", "expected_output": "2", "sort_order": 1},
            {"id": 1, "name": "a", "input": "1", "expected_output": "1", "sort_order": 1, "group_id": 1}
        ]
    })"_json;

    judge_request request = parse_judge_request(j, languages);
    EXPECT_EQ("sh", request.lang.key);
    EXPECT_EQ("echo 1", request.source_code);
    EXPECT_EQ(7, request.prob.id);
    EXPECT_EQ(1500, request.prob.time_limit_ms);
    EXPECT_EQ(65536, request.prob.memory_limit_kb);
    EXPECT_EQ(judge_type::DEFAULT, request.prob.judge_type);
    EXPECT_EQ(40, request.prob.group_points(1));
    EXPECT_EQ(0, request.prob.group_points(5));
    EXPECT_FALSE(request.checker);

    ASSERT_EQ(3, request.testcases.size());
    EXPECT_EQ(1, request.testcases[0].id);
    EXPECT_EQ(2, request.testcases[1].id);
    EXPECT_EQ(3, request.testcases[2].id);
    EXPECT_EQ(1, request.testcases[0].group_id);
    EXPECT_FALSE(request.testcases[1].group_id);
}

TEST_F(RequestTest, ResolveChecker) {
    json j = R"({
        "language": "sh",
        "source_code": "echo 1",
        "problem": {"judge_type": "custom", "checker_language_key": "sh-copy", "checker_source": "echo AC"}
    })"_json;

    judge_request request = parse_judge_request(j, languages);
    EXPECT_EQ(judge_type::CUSTOM, request.prob.judge_type);
    ASSERT_TRUE(request.checker);
    EXPECT_EQ("sh-copy", request.checker->language.key);
    EXPECT_EQ("echo AC", request.checker->source_code);
    EXPECT_TRUE(request.testcases.empty());
}

TEST_F(RequestTest, IncompleteChecker) {
    json j = R"({
        "language": "sh",
        "source_code": "echo 1",
        "problem": {"judge_type": "custom", "checker_language_key": "haskell", "checker_source": "main = print True"}
    })"_json;
    EXPECT_FALSE(parse_judge_request(j, languages).checker);

    j["problem"]["checker_language_key"] = "sh";
    j["problem"]["checker_source"] = "";
    EXPECT_FALSE(parse_judge_request(j, languages).checker);
}

TEST_F(RequestTest, InvalidRequest) {
    EXPECT_THROW(parse_judge_request(R"({"language": "cobol", "source_code": ""})"_json, languages), config_error);
    EXPECT_THROW(parse_judge_request(R"({"language": "sh"})"_json, languages), invalid_argument);
    EXPECT_THROW(parse_judge_request(R"({"source_code": ""})"_json, languages), invalid_argument);
    EXPECT_THROW(parse_judge_request(R"({"language": "sh", "source_code": "", "problem": 1})"_json, languages), invalid_argument);
}

TEST_F(RequestTest, ParseRunRequest) {
    run_request request = parse_run_request(R"({"language": "sh", "source_code": "cat", "input": "1\\n2"})"_json, languages);
    EXPECT_EQ("sh", request.lang.key);
    EXPECT_EQ("cat", request.source_code);
    EXPECT_EQ("1\\n2", request.input);
    EXPECT_FALSE(request.prob.time_limit_ms);
}
