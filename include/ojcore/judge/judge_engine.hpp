#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "ojcore/common/status.hpp"
#include "ojcore/judge/executor.hpp"
#include "ojcore/judge/resource_limits.hpp"
#include "ojcore/judge/security_validator.hpp"
#include "ojcore/language/language_registry.hpp"

namespace ojcore {

/**
 * @brief 一组测试数据，评测时只读
 */
struct test_case {
    /**
     * @brief 测试数据的 id，由题库分配，用于在评测结果中标识测试数据
     */
    int id = 0;

    std::string input;

    /**
     * @brief 标准输出，比较时忽略首尾空白字符
     */
    std::string expected_output;

    /**
     * @brief 测试数据在题目中的顺序
     */
    std::size_t ordinal = 0;

    /**
     * @brief 是否为样例数据（对选手可见）
     */
    bool is_sample = false;

    int points = 1;
};

/**
 * @brief 一组测试数据的评测结果
 */
struct test_case_result {
    int test_case_id = 0;

    std::size_t ordinal = 0;

    status result = status::ERROR;

    execution_outcome outcome;

    std::string expected_output;

    int points = 0;
};

/**
 * @brief 一次提交的评测结果
 */
struct judge_verdict {
    /**
     * @brief 第一个没有通过的测试数据的结果，全部通过时为 ACCEPTED
     */
    status overall = status::ACCEPTED;

    std::size_t passed_tests = 0;

    /**
     * @brief 测试数据的总数，编译错误时也是测试数据的总数
     */
    std::size_t total_tests = 0;

    /**
     * @brief 所有测试数据中最长的运行时间，单位为秒
     */
    double max_time = 0;

    /**
     * @brief 按测试数据顺序排列的评测结果，编译错误时只有一个
     */
    std::vector<test_case_result> results;

    /**
     * @brief 编译器的输出，只在编译错误时有值
     */
    std::optional<std::string> compilation_error;

    /**
     * @brief 所有测试数据的分值之和
     */
    int total_points = 0;

    /**
     * @brief 通过的测试数据的比例，百分制，没有测试数据时为 0
     * 这是评测系统给出的分数，不考虑测试数据的分值
     */
    double score() const;

    /**
     * @brief 通过的测试数据的分值之和，仅供需要按分值计分的调用方参考
     */
    int points_earned() const;
};

/**
 * @brief 根据运行结果判断一组测试数据的评测结果
 * 1. 超时为 TIME_LIMIT_EXCEEDED
 * 2. 编译失败为 COMPILATION_ERROR
 * 3. 正常退出时，去掉首尾空白后输出与标准输出相同为 ACCEPTED，否则为 WRONG_ANSWER
 * 4. 异常退出且 stderr 不为空为 RUNTIME_ERROR，否则为 ERROR
 */
status classify(const execution_outcome &outcome, const std::string &expected_output);

/**
 * @brief 评测引擎，用一个执行器依次运行所有测试数据并汇总评测结果
 * 评测引擎不保存可变状态，可以被多个评测线程同时调用。
 * 同一次提交的测试数据按顺序依次运行，不会并行。
 */
struct judge_engine {
    /**
     * 所有参数都必须比评测引擎活得更久
     */
    judge_engine(const language_registry &registry, const resource_limit_resolver &resolver, const security_validator &validator, const executor &exec);

    /**
     * @brief 评测一次提交
     * @param source 选手代码
     * @param language 语言标识符，可以是别名
     * @param test_cases 按顺序排列的测试数据
     * @param overrides 题目对时间和内存限制的覆盖
     * @throw not_supported_error 如果语言不受支持
     * @throw validation_error 如果源代码没有通过安全检查，此时不会运行任何程序
     * @throw judge_unavailable_error 如果执行器不可用
     * @throw configuration_error 如果题目的内存限制格式不正确
     */
    judge_verdict judge(const std::string &source, const std::string &language, const std::vector<test_case> &test_cases, const problem_overrides &overrides = {}) const;

    const executor &get_executor() const;

private:
    const language_registry &registry;
    const resource_limit_resolver &resolver;
    const security_validator &validator;
    const executor &exec;
};

}  // namespace ojcore
