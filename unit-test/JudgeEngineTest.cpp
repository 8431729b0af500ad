#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ojcore/common/exceptions.hpp"
#include "ojcore/judge/judge_engine.hpp"
#include "test/languages.hpp"
#include "test/mock_executor.hpp"

using namespace std;
using namespace ojcore;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;

class JudgeEngineTest : public ::testing::Test {
protected:
    JudgeEngineTest()
        : config(test::test_config()),
          registry(test::test_registry()),
          resolver(config),
          validator(config.security, config.max_source_size),
          engine(registry, resolver, validator, exec) {
        ON_CALL(exec, name()).WillByDefault(Return("mock"));
        ON_CALL(exec, available()).WillByDefault(Return(true));
    }

    static vector<test_case> make_tests(const vector<pair<string, string>> &data) {
        vector<test_case> tests;
        for (size_t i = 0; i < data.size(); ++i) {
            test_case tc;
            tc.id = (int)i + 1;
            tc.ordinal = i;
            tc.input = data[i].first;
            tc.expected_output = data[i].second;
            tests.push_back(tc);
        }
        return tests;
    }

    judge_config config;
    language_registry registry;
    resource_limit_resolver resolver;
    security_validator validator;
    NiceMock<test::mock_executor> exec;
    judge_engine engine;
};

TEST_F(JudgeEngineTest, Accepted) {
    EXPECT_CALL(exec, run("print(sum(map(int, input().split())))", "python", "1 2", _))
        .WillOnce(Return(test::exited("3\n")));
    EXPECT_CALL(exec, run(_, "python", "3 4", _))
        .WillOnce(Return(test::exited("  7  ")));

    judge_verdict verdict = engine.judge("print(sum(map(int, input().split())))", "py",
                                         make_tests({{"1 2", "3"}, {"3 4", "7\n"}}));
    EXPECT_EQ(verdict.overall, status::ACCEPTED);
    EXPECT_EQ(verdict.passed_tests, 2u);
    EXPECT_EQ(verdict.total_tests, 2u);
    EXPECT_DOUBLE_EQ(verdict.score(), 100);
    EXPECT_DOUBLE_EQ(verdict.max_time, 0.1);
    EXPECT_FALSE(verdict.compilation_error.has_value());
    ASSERT_EQ(verdict.results.size(), 2u);
    EXPECT_EQ(verdict.results[0].test_case_id, 1);
    EXPECT_EQ(verdict.results[1].ordinal, 1u);
    EXPECT_EQ(verdict.results[1].expected_output, "7\n");
}

TEST_F(JudgeEngineTest, FirstFailureDeterminesVerdict) {
    EXPECT_CALL(exec, run(_, _, "1", _)).WillOnce(Return(test::exited("1")));
    EXPECT_CALL(exec, run(_, _, "2", _)).WillOnce(Return(test::exited("3")));
    EXPECT_CALL(exec, run(_, _, "3", _)).WillOnce(Return(execution_outcome::time_limit_exceeded(1)));
    EXPECT_CALL(exec, run(_, _, "4", _)).WillOnce(Return(test::exited("4")));

    judge_verdict verdict = engine.judge("cat", "shell", make_tests({{"1", "1"}, {"2", "2"}, {"3", "3"}, {"4", "4"}}));
    EXPECT_EQ(verdict.overall, status::WRONG_ANSWER);
    EXPECT_EQ(verdict.passed_tests, 2u);
    EXPECT_DOUBLE_EQ(verdict.score(), 50);
    EXPECT_DOUBLE_EQ(verdict.max_time, 1);
    ASSERT_EQ(verdict.results.size(), 4u);
    EXPECT_EQ(verdict.results[1].result, status::WRONG_ANSWER);
    EXPECT_EQ(verdict.results[2].result, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(verdict.results[3].result, status::ACCEPTED);
}

TEST_F(JudgeEngineTest, CompilationErrorStopsJudging) {
    EXPECT_CALL(exec, run(_, "cpp", _, _))
        .Times(1)
        .WillOnce(Return(execution_outcome::compilation_failed("expected ';' before '}' token")));

    judge_verdict verdict = engine.judge("int main() { return 0 }", "c++", make_tests({{"", "0"}, {"", "0"}, {"", "0"}}));
    EXPECT_EQ(verdict.overall, status::COMPILATION_ERROR);
    EXPECT_EQ(verdict.results.size(), 1u);
    EXPECT_EQ(verdict.passed_tests, 0u);
    EXPECT_EQ(verdict.total_tests, 3u);
    EXPECT_DOUBLE_EQ(verdict.score(), 0);
    EXPECT_EQ(verdict.compilation_error, "expected ';' before '}' token");
}

TEST_F(JudgeEngineTest, CompilationErrorOverridesEarlierFailure) {
    EXPECT_CALL(exec, run(_, _, "1", _)).WillOnce(Return(test::exited("wrong")));
    EXPECT_CALL(exec, run(_, _, "2", _)).WillOnce(Return(execution_outcome::compilation_failed("boom")));

    judge_verdict verdict = engine.judge("cat", "shellc", make_tests({{"1", "1"}, {"2", "2"}, {"3", "3"}}));
    EXPECT_EQ(verdict.overall, status::COMPILATION_ERROR);
    EXPECT_EQ(verdict.results.size(), 2u);
}

TEST_F(JudgeEngineTest, Classify) {
    EXPECT_EQ(classify(test::exited("42\n"), "42"), status::ACCEPTED);
    EXPECT_EQ(classify(test::exited("\n 42 \t"), " 42\n\n"), status::ACCEPTED);
    EXPECT_EQ(classify(test::exited("4 2"), "42"), status::WRONG_ANSWER);
    EXPECT_EQ(classify(test::exited("42\n43"), "42\n 43"), status::WRONG_ANSWER);
    EXPECT_EQ(classify(test::exited("", 1, "Traceback (most recent call last)"), ""), status::RUNTIME_ERROR);
    EXPECT_EQ(classify(test::exited("42", 139), "42"), status::ERROR);
    EXPECT_EQ(classify(execution_outcome::time_limit_exceeded(2), ""), status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(classify(execution_outcome::compilation_failed(""), ""), status::COMPILATION_ERROR);
    EXPECT_EQ(classify(execution_outcome::failure("Container execution error: cannot start"), ""), status::ERROR);
}

TEST_F(JudgeEngineTest, RuntimeErrorAndError) {
    EXPECT_CALL(exec, run(_, _, "1", _)).WillOnce(Return(test::exited("", 137)));
    EXPECT_CALL(exec, run(_, _, "2", _)).WillOnce(Return(test::exited("", 1, "ZeroDivisionError")));

    judge_verdict verdict = engine.judge("print(1/0)", "python", make_tests({{"1", "1"}, {"2", "2"}}));
    EXPECT_EQ(verdict.overall, status::ERROR);
    EXPECT_EQ(verdict.results[1].result, status::RUNTIME_ERROR);
}

TEST_F(JudgeEngineTest, RejectedSourceIsNeverExecuted) {
    EXPECT_CALL(exec, run(_, _, _, _)).Times(0);

    try {
        engine.judge("import os\nos.system('ls')\n", "python", make_tests({{"", ""}}));
        FAIL() << "judge should throw";
    } catch (validation_error &ex) {
        EXPECT_EQ(ex.reason, "Blocked import: os");
        EXPECT_STREQ(ex.what(), "Submission rejected: Blocked import: os");
    }

    EXPECT_THROW(engine.judge(string(config.max_source_size + 1, 'a'), "cpp", make_tests({{"", ""}})), validation_error);
}

TEST_F(JudgeEngineTest, UnsupportedLanguage) {
    EXPECT_CALL(exec, run(_, _, _, _)).Times(0);
    EXPECT_THROW(engine.judge("", "cobol", make_tests({{"", ""}})), not_supported_error);
}

TEST_F(JudgeEngineTest, ExecutorUnavailable) {
    EXPECT_CALL(exec, available()).WillOnce(Return(false));
    EXPECT_CALL(exec, run(_, _, _, _)).Times(0);

    EXPECT_THROW(engine.judge("print(1)", "python", make_tests({{"", "1"}})), judge_unavailable_error);
}

TEST_F(JudgeEngineTest, LimitsAreResolvedOnce) {
    problem_overrides overrides;
    overrides.time_limit = 2;
    overrides.memory_limit = "32m";

    EXPECT_CALL(exec, run(_, "shell", _, Field(&resource_limits::time_limit, 2)))
        .Times(3)
        .WillRepeatedly(Return(test::exited("")));

    engine.judge("true", "sh", make_tests({{"", ""}, {"", ""}, {"", ""}}), overrides);

    EXPECT_CALL(exec, run(_, "shell", _, Field(&resource_limits::memory_limit, 64 * 1024 * 1024)))
        .WillOnce(Return(test::exited("")));
    engine.judge("true", "sh", make_tests({{"", ""}}));
}

TEST_F(JudgeEngineTest, MalformedProblemMemoryLimit) {
    problem_overrides overrides;
    overrides.memory_limit = "a lot";
    EXPECT_CALL(exec, run(_, _, _, _)).Times(0);
    EXPECT_THROW(engine.judge("true", "sh", make_tests({{"", ""}}), overrides), configuration_error);
}

TEST_F(JudgeEngineTest, JudgingIsRepeatable) {
    EXPECT_CALL(exec, run(_, _, "1", _)).WillRepeatedly(Return(test::exited("1")));
    EXPECT_CALL(exec, run(_, _, "2", _)).WillRepeatedly(Return(test::exited("3")));

    vector<test_case> tests = make_tests({{"1", "1"}, {"2", "2"}});
    judge_verdict first = engine.judge("cat", "shell", tests);
    judge_verdict second = engine.judge("cat", "shell", tests);
    EXPECT_EQ(first.overall, second.overall);
    EXPECT_EQ(first.passed_tests, second.passed_tests);
    EXPECT_EQ(first.results.size(), second.results.size());
}

TEST_F(JudgeEngineTest, ScoreAndPoints) {
    vector<test_case> tests = make_tests({{"1", "1"}, {"2", "2"}, {"3", "3"}});
    tests[0].points = 10;
    tests[1].points = 20;
    tests[2].points = 70;
    EXPECT_CALL(exec, run(_, _, "1", _)).WillOnce(Return(test::exited("1")));
    EXPECT_CALL(exec, run(_, _, "2", _)).WillOnce(Return(test::exited("2")));
    EXPECT_CALL(exec, run(_, _, "3", _)).WillOnce(Return(test::exited("0")));

    judge_verdict verdict = engine.judge("cat", "shell", tests);
    EXPECT_EQ(verdict.total_points, 100);
    EXPECT_EQ(verdict.points_earned(), 30);
    // 分数只按通过的测试数据比例计算
    EXPECT_NEAR(verdict.score(), 66.67, 0.01);
}

TEST_F(JudgeEngineTest, NoTestCases) {
    EXPECT_CALL(exec, run(_, _, _, _)).Times(0);

    judge_verdict verdict = engine.judge("cat", "shell", {});
    EXPECT_EQ(verdict.overall, status::ACCEPTED);
    EXPECT_EQ(verdict.total_tests, 0u);
    EXPECT_DOUBLE_EQ(verdict.score(), 0);
}
